#include <iostream>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "wildcard/wildcard_trie.hpp"
#include "word_source/word_list_loader.hpp"

static void assert_true(bool cond, const char *msg)
{
    if (!cond)
    {
        std::cerr << "[FAIL] " << msg << "\n";
        std::exit(1);
    }
}

int main()
{
    // =========================================================
    // 1) stream: CRLF, empty, wildcard and bad UTF-8 lines
    // =========================================================
    {
        WildcardTrie t;
        std::istringstream in("fun\r\nfund\n\nbad*word\nfun farm\n\xC3\npotato\n");
        const auto stats = loadWordList(t, in);

        assert_true(stats.lines == 7, "seven lines read");
        assert_true(stats.inserted == 4, "four valid words inserted");
        assert_true(stats.skipped == 3, "empty, wildcard and bad UTF-8 lines skipped");
        assert_true(t.isWord(U"fun"), "CR should be stripped before insert");
        assert_true(t.isWord(U"fun farm"), "spaces are kept");
        assert_true(!t.isPrefix(U"bad"), "rejected line must leave no path");
        assert_true(t.getMatchingWords(U"pot*to").size() == 1, "pot*to finds potato");
    }

    // =========================================================
    // 1b) malformed UTF-8 is reported by line number only
    // =========================================================
    {
        WildcardTrie t;
        std::istringstream in("ok\n\xC3\x28" "bad\n");
        std::ostringstream err;
        std::streambuf *old = std::cerr.rdbuf(err.rdbuf());
        const auto stats = loadWordList(t, in);
        std::cerr.rdbuf(old);

        const std::string report = err.str();
        assert_true(stats.inserted == 1 && stats.skipped == 1, "bad line skipped, good line kept");
        assert_true(report.find("[BAD_UTF8] line 2") != std::string::npos,
                    "malformed line should be reported with its number");
        assert_true(report.find('\xC3') == std::string::npos,
                    "raw malformed bytes must not be echoed");
    }

    // =========================================================
    // 2) file
    // =========================================================
    {
        const std::string path = "word_list_loader_test.txt";
        {
            std::ofstream out(path, std::ios::binary);
            out << "すみれ\nすみ\nかな\nかな\n";
        }

        WildcardTrie t;
        const auto stats = loadWordListFromFile(t, path);
        assert_true(stats.inserted == 4 && stats.skipped == 0, "all lines inserted");
        assert_true(t.size() == 3, "duplicate line stored once");
        assert_true(t.isWord(U"す*れ"), "loaded hiragana word matches with wildcard");
    }

    // =========================================================
    // 3) missing file
    // =========================================================
    {
        WildcardTrie t;
        bool threw = false;
        try
        {
            loadWordListFromFile(t, "does/not/exist/words.txt");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert_true(threw, "missing file should throw runtime_error");
        assert_true(t.empty(), "trie stays empty");
    }

    std::cout << "[OK] all word list loader tests passed\n";
    return 0;
}
