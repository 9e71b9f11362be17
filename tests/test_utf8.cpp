#include <iostream>
#include <cstdlib>
#include <string>

#include "common/utf8.hpp"

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
    {
        std::u32string out;
        assert_true(utf8_to_u32("pot*to", out) && out == U"pot*to", "ASCII decode");
        assert_true(utf8_to_u32("café", out) && out == U"café", "2-byte decode");
        assert_true(utf8_to_u32("かな", out) && out == U"かな", "3-byte decode");
        assert_true(utf8_to_u32("\xF0\x9F\x98\x80", out) && out == U"\U0001F600", "4-byte decode");
        assert_true(utf8_to_u32("", out) && out.empty(), "empty decode");
    }

    {
        std::u32string out;
        assert_true(!utf8_to_u32("\xC3", out), "truncated sequence should fail");
        assert_true(!utf8_to_u32("\xC0\xAF", out), "overlong sequence should fail");
        assert_true(!utf8_to_u32("\xED\xA0\x80", out), "surrogate should fail");
        assert_true(!utf8_to_u32("\xFF", out), "invalid lead byte should fail");
    }

    {
        assert_true(u32_to_utf8(U"fun farm") == "fun farm", "ASCII encode");
        assert_true(u32_to_utf8(U"すみれ") == "すみれ", "hiragana encode");
        assert_true(u32_to_utf8(U"\U0001F600") == "\xF0\x9F\x98\x80", "4-byte encode");
    }

    std::cout << "[OK] all utf8 tests passed\n";
    return 0;
}
