/* One game: a secret word, the guesses made so far and their results.

   A Game is mutable and has no internal locking. Calls to attempt() on the
   same instance must be serialized by the owner. The Dictionary it was built
   with is shared and read-only.
*/

#pragma once
#include <vector>
#include <memory>
#include <stdexcept>
#include "word.hpp"
#include "result.hpp"
#include "dictionary.hpp"

class Game {
public:
    enum class State { in_progress, solved, exhausted };

    struct Options {
        Options();
        size_t min_length;
        size_t max_length;
        // a previously correct letter must stay in place in every later guess.
        // Hard games get one extra attempt.
        bool hard_mode;
        std::string secret_word; // empty = pick one from the dictionary
        bool debug;              // allow get_secret_word()
    };

    class Already_solved : public std::runtime_error {
    public:
        Already_solved() : std::runtime_error("You have already solved this word!") {}
    };
    class Max_attempts_reached : public std::runtime_error {
    public:
        Max_attempts_reached() : std::runtime_error("You have reached the maximum number of attempts") {}
    };
    class Letter_locked : public std::runtime_error {
    public:
        Letter_locked() : std::runtime_error("You cannot change a letter that is in the correct position") {}
    };
    class Secret_hidden : public std::runtime_error {
    public:
        Secret_hidden() : std::runtime_error("Secret word is only available in debug mode") {}
    };

    // throws std::invalid_argument if the secret word is out of range or not a
    // dictionary word, Dictionary::No_matching_words if none can be picked.
    // A null dictionary means Dictionary::default_dictionary().
    Game(const Options& options, std::shared_ptr<const Dictionary> dictionary = nullptr);

    // Scores [guess] and records it. Nothing is recorded if this throws.
    Result attempt(const std::string& guess);

    static int get_max_attempts_for_length(size_t length, bool hard_mode);

    int get_current_attempt() const { return static_cast<int>(attempts.size()); }
    int get_max_attempts() const { return max_attempts; }
    bool is_solved() const { return solved; }
    bool is_hard_mode() const { return hard_mode; }
    State get_state() const;
    const std::vector<Result>& get_attempts() const { return attempts; }
    const std::vector<bool>& get_locked_positions() const { return locked; }
    const Dictionary& get_dictionary() const { return *dictionary; }

    // throws Secret_hidden unless the game was made with Options::debug
    const Word& get_secret_word() const;

    static void test(const std::string& words_file);
private:
    static Word choose_secret_word(const Options& options, const Dictionary& dictionary);

    std::shared_ptr<const Dictionary> dictionary;
    Word secret_word;
    bool hard_mode;
    bool debug;
    int max_attempts;
    bool solved;
    std::vector<Result> attempts;
    std::vector<bool> locked; // hard mode: positions that must keep the secret's letter
};

std::ostream& operator<<(std::ostream& os, Game::State s);
