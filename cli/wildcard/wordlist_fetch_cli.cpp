#include <filesystem>
#include <iostream>
#include <string>

#include "word_source/word_list_fetch.hpp"

static void usage(const char *argv0)
{
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " --url <url> --out <path> [--force]\n";
}

int main(int argc, char **argv)
{
    try
    {
        std::string url;
        std::string out;
        bool force = false;

        for (int i = 1; i < argc; ++i)
        {
            const std::string a = argv[i];
            if (a == "--help" || a == "-h")
            {
                usage(argv[0]);
                return 0;
            }
            if (a == "--url" && i + 1 < argc)
            {
                url = argv[++i];
                continue;
            }
            if (a == "--out" && i + 1 < argc)
            {
                out = argv[++i];
                continue;
            }
            if (a == "--force")
            {
                force = true;
                continue;
            }
            std::cerr << "Unknown/incomplete arg: " << a << "\n";
            usage(argv[0]);
            return 2;
        }

        if (url.empty() || out.empty())
        {
            usage(argv[0]);
            return 2;
        }

        const std::filesystem::path out_path = out;
        if (!force && fileExistsNonEmpty(out_path))
        {
            std::cout << "[SKIP] already present: " << out_path.string() << "\n";
        }
        else
        {
            std::cout << "[DOWNLOAD] " << url << "\n";
            downloadWordList(url, out_path);
        }

        std::cout << out_path.string() << " size=" << std::filesystem::file_size(out_path) << " bytes\n";
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
