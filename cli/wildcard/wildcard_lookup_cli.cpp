#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "common/utf8.hpp"
#include "wildcard/wildcard_trie.hpp"
#include "word_source/word_list_loader.hpp"

enum class LookupMode
{
    Match,
    Word,
    Prefix,
};

static void usage(const char *argv0)
{
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [--dict <file>] [--q <term>] [--mode match|word|prefix]\n"
        << "  " << argv0 << " [--dict <file>] --stdin [--mode match|word|prefix]\n"
        << "Options:\n"
        << "  --wildcard <char>   single character matching any one character (default '*')\n"
        << "  --no-wildcard       treat every character literally\n"
        << "Defaults: --dict /usr/share/dict/words --q 'pot*to' --mode match\n";
}

static LookupMode parse_mode(const std::string &s)
{
    if (s == "match")
        return LookupMode::Match;
    if (s == "word")
        return LookupMode::Word;
    if (s == "prefix")
        return LookupMode::Prefix;
    throw std::runtime_error("Unknown mode: " + s);
}

static std::optional<char32_t> parse_wildcard(const std::string &s)
{
    std::u32string w;
    if (!utf8_to_u32(s, w) || w.size() != 1)
        throw std::runtime_error("--wildcard expects exactly one character: " + s);
    return w.front();
}

static void run_one(const WildcardTrie &trie, LookupMode mode, const std::string &q_utf8)
{
    std::u32string q;
    if (!utf8_to_u32(q_utf8, q))
    {
        std::cout << "[BAD_UTF8] " << q_utf8 << "\n";
        return;
    }

    switch (mode)
    {
    case LookupMode::Word:
        std::cout << q_utf8 << " word=" << (trie.isWord(q) ? "true" : "false") << "\n";
        return;
    case LookupMode::Prefix:
        std::cout << q_utf8 << " prefix=" << (trie.isPrefix(q) ? "true" : "false") << "\n";
        return;
    case LookupMode::Match:
        break;
    }

    const auto hits = trie.getMatchingWords(q);

    std::vector<std::string> lines;
    lines.reserve(hits.size());
    for (const auto &h : hits)
        lines.push_back(u32_to_utf8(h));
    std::sort(lines.begin(), lines.end());

    std::cout << hits.size() << " words match " << q_utf8 << " in provided dict:\n";
    for (const auto &l : lines)
        std::cout << l << "\n";
}

int main(int argc, char **argv)
{
    try
    {
        std::string dict_path = "/usr/share/dict/words";
        std::string q = "pot*to";
        bool stdin_mode = false;
        LookupMode mode = LookupMode::Match;
        std::optional<char32_t> wildcard = WildcardTrie::kDefaultWildcard;

        for (int i = 1; i < argc; ++i)
        {
            const std::string a = argv[i];
            if (a == "--help" || a == "-h")
            {
                usage(argv[0]);
                return 0;
            }
            if (a == "--dict" && i + 1 < argc)
            {
                dict_path = argv[++i];
                continue;
            }
            if (a == "--q" && i + 1 < argc)
            {
                q = argv[++i];
                continue;
            }
            if (a == "--mode" && i + 1 < argc)
            {
                mode = parse_mode(argv[++i]);
                continue;
            }
            if (a == "--wildcard" && i + 1 < argc)
            {
                wildcard = parse_wildcard(argv[++i]);
                continue;
            }
            if (a == "--no-wildcard")
            {
                wildcard = std::nullopt;
                continue;
            }
            if (a == "--stdin")
            {
                stdin_mode = true;
                continue;
            }
            std::cerr << "Unknown/incomplete arg: " << a << "\n";
            usage(argv[0]);
            return 2;
        }

        WildcardTrie trie(wildcard);
        const auto stats = loadWordListFromFile(trie, dict_path);
        std::cerr << "[LOAD] " << dict_path << " lines=" << stats.lines
                  << " words=" << trie.size() << " skipped=" << stats.skipped
                  << " nodes=" << trie.nodeCount() << "\n";

        if (!stdin_mode)
        {
            run_one(trie, mode, q);
            return 0;
        }

        std::string line;
        while (std::getline(std::cin, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;
            run_one(trie, mode, line);
        }
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
