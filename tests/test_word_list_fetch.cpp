#include <iostream>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "wildcard/wildcard_trie.hpp"
#include "word_source/word_list_fetch.hpp"
#include "word_source/word_list_loader.hpp"

static void assert_true(bool cond, const char *msg)
{
    if (!cond)
    {
        std::cerr << "[FAIL] " << msg << "\n";
        std::exit(1);
    }
}

static std::string read_all(const std::filesystem::path &p)
{
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int main()
{
    const std::filesystem::path src = std::filesystem::absolute("word_list_fetch_src.txt");
    const std::filesystem::path dst = "word_list_fetch_out/words.txt";
    const std::string body = "fun\nfund\nfarm\n";

    {
        std::ofstream out(src, std::ios::binary);
        out << body;
    }
    std::filesystem::remove_all("word_list_fetch_out");

    // =========================================================
    // 1) file:// download into a new directory
    // =========================================================
    {
        assert_true(!fileExistsNonEmpty(dst), "destination should not exist yet");
        downloadWordList("file://" + src.string(), dst);
        assert_true(fileExistsNonEmpty(dst), "destination should exist after download");
        assert_true(read_all(dst) == body, "downloaded content should match source");
        assert_true(!std::filesystem::exists("word_list_fetch_out/words.txt.part"),
                    "no partial file should remain after a successful download");

        WildcardTrie t;
        loadWordListFromFile(t, dst.string());
        assert_true(t.getMatchingWords(U"f**d").size() == 1, "downloaded list loads into the trie");
    }

    // =========================================================
    // 2) unreadable source
    // =========================================================
    {
        bool threw = false;
        try
        {
            downloadWordList("file:///does/not/exist/words.txt", "word_list_fetch_out/missing.txt");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert_true(threw, "unreadable source should throw runtime_error");
        assert_true(!std::filesystem::exists("word_list_fetch_out/missing.txt"),
                    "failed download must not create the output file");
        assert_true(!std::filesystem::exists("word_list_fetch_out/missing.txt.part"),
                    "failed download must not leave a partial file");
        assert_true(!fileExistsNonEmpty("word_list_fetch_out/missing.txt"),
                    "a later run must not mistake the failed fetch for a finished list");
    }

    // =========================================================
    // 3) failed re-download keeps the previous list
    // =========================================================
    {
        bool threw = false;
        try
        {
            downloadWordList("file:///does/not/exist/words.txt", dst);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert_true(threw, "unreadable source should throw runtime_error");
        assert_true(read_all(dst) == body, "existing list should be untouched by a failed fetch");
        assert_true(!std::filesystem::exists("word_list_fetch_out/words.txt.part"),
                    "no partial file should remain after a failed re-download");
    }

    std::cout << "[OK] all word list fetch tests passed\n";
    return 0;
}
