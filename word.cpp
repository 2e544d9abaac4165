#include <sstream>
#include <stdexcept>
#include "word.hpp"

int Word::letter_bit(char c) {
    if (c >= 'a' && c <= 'z') return c - 'a';
    if (c >= 'A' && c <= 'Z') return c - 'A';
    return -1;
}

bool Word::is_valid(const std::string& r) {
    if (r.empty()) return false;
    for (char c : r) {
        if (letter_bit(c) < 0) return false;
    }
    return true;
}

Word::Word(const std::string& r) : all_letters(0) {
    if (r.empty()) {
        throw std::invalid_argument("Expected a word, got an empty string");
    }
    letters.reserve(r.length());
    for (char c : r) {
        int p = letter_bit(c);
        if (p < 0) {
            throw std::invalid_argument("Expected only letters, not: " + r);
        }
        letters.push_back(static_cast<char>('A' + p));
        all_letters |= (1 << p);
    }
}

bool Word::contains(char c) const {
    int p = letter_bit(c);
    return p >= 0 && (all_letters & (1 << p)) != 0;
}

bool Word::operator==(const Word& r) const {
    return letters == r.letters;
}

bool Word::operator!=(const Word& r) const {
    return letters != r.letters;
}

bool Word::operator<(const Word& r) const {
    return letters < r.letters;
}

std::ostream& operator<<(std::ostream& os, const Word& x) {
    return os << x.letters;
}

void Word::test() {
    Word x("azZAq");
    std::stringstream output1;
    std::stringstream expected1;

    output1 << x << " "
            << x.length() << " "
            << x.all_letters << " "
            << x.contains('a') << x.contains('Z') << x.contains('q') << x.contains('b') << x.contains('!')
            << std::endl;

    expected1 << "AZZAQ" << " "
              << 5 << " "
              << int32_t(1<<0) + (1<<16) + (1<<25) << " "
              << "11100"
              << std::endl;

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Word::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
    }

    std::stringstream output2;
    output2 << Word("scrabble") << " "
            << (Word("Valid") == Word("VALID")) << " "
            << (Word("apple") < Word("apply")) << " "
            << is_valid("") << is_valid("wow") << is_valid("two words") << is_valid("x1");
    if (output2.str() != "SCRABBLE 1 1 0100") {
        throw std::runtime_error("Word::test() 2 failed, got " + output2.str());
    }

    const char* bad[] = { "", "don't", "tab\t", "caf\xc3\xa9" };
    for (const char* b : bad) {
        bool threw = false;
        try {
            Word w(b);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            throw std::runtime_error("Word::test() 3 failed, accepted: " + std::string(b));
        }
    }
}
