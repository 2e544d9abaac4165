/* Represents a filled in row in the game, ie. the information gained from testing
   a guess against the secret word: the guess plus, for every position, whether
   the letter is somewhere in the secret and whether it is in the right place.

   "Present" is a whole-word test. A guess with two E's against a secret with
   one E marks both E's present; there is no per-occurrence bookkeeping.
*/

#pragma once
#include <vector>
#include "word.hpp"

class LetterResult {
public:
    LetterResult(char letter_, bool letter_present_, bool position_correct_)
        : letter(letter_), letter_present(letter_present_), position_correct(position_correct_) {}

    char get_letter() const { return letter; }
    bool is_letter_present() const { return letter_present; }
    bool is_position_correct() const { return position_correct; }

    bool operator==(const LetterResult& r) const;
private:
    char letter;
    bool letter_present;
    bool position_correct;
};

class Result {
public:
    // format is PAPER ~~.~_
    // one mark per letter: . right place, ~ somewhere else in the word, _ not in the word
    Result(const std::string& r);

    // throws std::invalid_argument if the lengths differ
    Result(const Word& answer, const Word& guess);

    size_t size() const { return letters.size(); }
    const LetterResult& operator[](size_t i) const { return letters[i]; }
    char get_letter(size_t i) const { return letters[i].get_letter(); }
    bool is_letter_present(size_t i) const { return letters[i].is_letter_present(); }
    bool is_position_correct(size_t i) const { return letters[i].is_position_correct(); }

    std::vector<LetterResult>::const_iterator begin() const { return letters.begin(); }
    std::vector<LetterResult>::const_iterator end() const { return letters.end(); }

    int num_correct() const;
    int num_misplaced() const;
    int num_absent() const;
    bool is_solved() const;

    // same notation the string constructor reads
    std::string to_string() const;

    bool operator==(const Result& r) const;
    bool operator!=(const Result& r) const;

    static const char absent_char;
    static const char misplaced_char;
    static const char correct_char;

    static void test();
private:
    std::vector<LetterResult> letters;
};

std::ostream& operator<<(std::ostream& os, const Result& x);
