#pragma once
#include <stdexcept>
#include <string>

class InvalidWordError : public std::invalid_argument
{
public:
    explicit InvalidWordError(const std::string &word_utf8)
        : std::invalid_argument("Passed invalid word (" + word_utf8 + ") to insert()."),
          word_(word_utf8)
    {
    }

    const std::string &word() const { return word_; }

private:
    std::string word_;
};
