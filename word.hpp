/* Represents a normalized word: upper case ASCII letters only, any length >= 1.

   Each Word also keeps a 26-bit mask of the letters it contains, so the
   "is this letter anywhere in the word" question that Result asks for every
   position is a single AND instead of a scan.
*/

#pragma once
#include <string>
#include <iostream>
#include <cstdint>

class Word {
public:
    // throws std::invalid_argument if r is empty or has anything but letters
    Word(const std::string& r);

    // true iff Word(r) would succeed
    static bool is_valid(const std::string& r);

    bool operator==(const Word& r) const;
    bool operator!=(const Word& r) const;
    bool operator<(const Word& r) const;
    char operator[](size_t pos) const { return letters[pos]; }
    size_t length() const { return letters.length(); }
    const std::string& str() const { return letters; }

    // case insensitive, false for non-letters
    bool contains(char c) const;

    friend std::ostream& operator<<(std::ostream& os, const Word& x);

    static void test();
private:
    static int letter_bit(char c); // -1 if not a letter

    std::string letters;
    int32_t all_letters;
};

std::ostream& operator<<(std::ostream& os, const Word& x);
