#include <sstream>
#include <stdexcept>
#include <boost/lexical_cast.hpp>
#include "result.hpp"

using std::string;

bool LetterResult::operator==(const LetterResult& r) const {
    return letter == r.letter && letter_present == r.letter_present && position_correct == r.position_correct;
}

Result::Result(const string& r) {
    string word;
    string marks;
    for (char c : r) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
            word.push_back(c);
        } else if (c == absent_char || c == misplaced_char || c == correct_char) {
            marks.push_back(c);
        } else if (c != ' ') {
            throw std::invalid_argument("Unexpected character in result: " + r);
        }
    }
    if (word.empty() || word.length() != marks.length()) {
        throw std::invalid_argument("Expected a word and one mark per letter, not: " + r);
    }

    Word w(word);
    letters.reserve(w.length());
    for (size_t i = 0; i < w.length(); i++) {
        letters.push_back(LetterResult(w[i], marks[i] != absent_char, marks[i] == correct_char));
    }
}

Result::Result(const Word& answer, const Word& guess) {
    if (answer.length() != guess.length()) {
        throw std::invalid_argument("Can't compare a " + boost::lexical_cast<string>(guess.length())
                                    + " letter guess against a " + boost::lexical_cast<string>(answer.length())
                                    + " letter word");
    }
    letters.reserve(guess.length());
    for (size_t i = 0; i < guess.length(); i++) {
        letters.push_back(LetterResult(guess[i], answer.contains(guess[i]), answer[i] == guess[i]));
    }
}

int Result::num_correct() const {
    int n = 0;
    for (const LetterResult& l : letters) {
        if (l.is_position_correct()) n++;
    }
    return n;
}

int Result::num_misplaced() const {
    int n = 0;
    for (const LetterResult& l : letters) {
        if (l.is_letter_present() && !l.is_position_correct()) n++;
    }
    return n;
}

int Result::num_absent() const {
    int n = 0;
    for (const LetterResult& l : letters) {
        if (!l.is_letter_present()) n++;
    }
    return n;
}

bool Result::is_solved() const {
    return !letters.empty() && num_correct() == static_cast<int>(letters.size());
}

string Result::to_string() const {
    string word;
    string marks;
    for (const LetterResult& l : letters) {
        word.push_back(l.get_letter());
        if (l.is_position_correct()) {
            marks.push_back(correct_char);
        } else if (l.is_letter_present()) {
            marks.push_back(misplaced_char);
        } else {
            marks.push_back(absent_char);
        }
    }
    return word + " " + marks;
}

bool Result::operator==(const Result& r) const { return letters == r.letters; }
bool Result::operator!=(const Result& r) const { return !(letters == r.letters); }

const char Result::absent_char    = '_';
const char Result::misplaced_char = '~';
const char Result::correct_char   = '.';

std::ostream& operator<<(std::ostream& os, const Result& x) {
    for (const LetterResult& l : x) {
        if (l.is_position_correct()) {
            os << "\033[30;42m" << l.get_letter();
        } else if (l.is_letter_present()) {
            os << "\033[30;43m" << l.get_letter();
        } else {
            os << "\033[37;40m" << l.get_letter();
        }
    }
    return (os << "\033[0m");
}

void Result::test() {
    std::stringstream output1;
    std::stringstream expected1;

    output1 << Result(Word("APPLE"), Word("paper")).to_string() << std::endl
            << Result(Word("BRINE"), Word("SWEET")).to_string() << std::endl
            << Result(Word("MUMMY"), Word("MMYYM")).to_string() << std::endl
            << Result(Word("PHOTO"), Word("FLOOD")).to_string() << std::endl
            << Result(Word("VALID"), Word("LLAMA")).to_string() << std::endl
            << Result(Word("VALID"), Word("valid")).to_string() << std::endl;

    expected1 << "PAPER ~~.~_" << std::endl
              << "SWEET __~~_" << std::endl
              << "MMYYM .~~~~" << std::endl
              << "FLOOD __.~_" << std::endl
              << "LLAMA ~~~_~" << std::endl
              << "VALID ....." << std::endl;

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Result::test() 1 failed, got\n" + output1_str + ", but expected\n" + expected1_str);
    }

    // every position is judged on its own: correct == same letter, present == anywhere in the answer
    const char* pairs[][2] = { {"SCRABBLE", "BABBLERS"}, {"HELLO", "LLLLL"}, {"WOW", "OWO"}, {"ABCDE", "ZAFDL"} };
    for (auto& p : pairs) {
        Word answer(p[0]);
        Word guess(p[1]);
        Result r(answer, guess);
        if (r.size() != answer.length()) {
            throw std::runtime_error("Result::test() 2 failed, wrong size for " + guess.str());
        }
        for (size_t i = 0; i < r.size(); i++) {
            if (r.get_letter(i) != guess[i]
                || r.is_position_correct(i) != (guess[i] == answer[i])
                || r.is_letter_present(i) != (answer.str().find(guess[i]) != string::npos)) {
                throw std::runtime_error("Result::test() 2 failed for " + answer.str() + "/" + guess.str()
                                         + " at " + boost::lexical_cast<string>(i));
            }
        }
        if (Result(answer, guess) != r) {
            throw std::runtime_error("Result::test() 2 failed, not repeatable for " + guess.str());
        }
    }

    std::stringstream output3;
    Result paper("PAPER ~~.~_");
    output3 << paper.num_correct() << paper.num_misplaced() << paper.num_absent() << paper.is_solved() << " "
            << (paper == Result(Word("APPLE"), Word("PAPER"))) << " "
            << Result("valid .....").is_solved() << " "
            << (Result("PAPER ~~.~_") == Result("PAPER ~~._~"));
    if (output3.str() != "1310 1 1 0") {
        throw std::runtime_error("Result::test() 3 failed, got " + output3.str());
    }

    std::stringstream output4;
    std::stringstream expected4;
    output4 << Result(Word("APPLE"), Word("PAPER"));
    expected4 << "\033[30;43mP\033[30;43mA\033[30;42mP\033[30;43mE\033[37;40mR\033[0m";
    if (output4.str() != expected4.str()) {
        throw std::runtime_error("Result::test() 4 failed");
    }

    const char* bad[] = { "PAPER ~~.~", "PAPER ~~.~_!", "", "~~.~_" };
    for (const char* b : bad) {
        bool threw = false;
        try {
            Result r(b);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            throw std::runtime_error("Result::test() 5 failed, accepted: " + string(b));
        }
    }

    bool threw = false;
    try {
        Result r(Word("VALID"), Word("INVALID"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        throw std::runtime_error("Result::test() 6 failed, compared words of different length");
    }
}
