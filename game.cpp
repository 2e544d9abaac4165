#include <sstream>
#include <boost/lexical_cast.hpp>
#include "game.hpp"
#include "scoped_env.hpp"

using std::string;
using std::vector;

Game::Options::Options() : min_length(5), max_length(5), hard_mode(false), debug(false) {}

Game::Game(const Options& options, std::shared_ptr<const Dictionary> dictionary_) :
    dictionary(dictionary_ ? dictionary_ : Dictionary::default_dictionary()),
    secret_word(choose_secret_word(options, *dictionary)),
    hard_mode(options.hard_mode),
    debug(options.debug),
    max_attempts(get_max_attempts_for_length(secret_word.length(), options.hard_mode)),
    solved(false),
    locked(secret_word.length(), false)
{
    // recording an attempt must not reallocate (and so can't throw) once the result is computed
    attempts.reserve(max_attempts);
}

Word Game::choose_secret_word(const Options& options, const Dictionary& dictionary) {
    string w = options.secret_word.empty()
        ? dictionary.get_random_word(options.min_length, options.max_length).str()
        : options.secret_word;

    if (w.length() > options.max_length || w.length() < options.min_length) {
        throw std::invalid_argument("Secret word must be between min_length and max_length");
    }
    if (!dictionary.is_word(w)) {
        throw std::invalid_argument("Secret word must be a valid word in the dictionary");
    }
    return Word(w);
}

int Game::get_max_attempts_for_length(size_t length, bool hard_mode) {
    return static_cast<int>(length) + 1 + (hard_mode ? 1 : 0);
}

Game::State Game::get_state() const {
    if (solved) return State::solved;
    if (get_current_attempt() >= max_attempts) return State::exhausted;
    return State::in_progress;
}

const Word& Game::get_secret_word() const {
    if (!debug) throw Secret_hidden();
    return secret_word;
}

Result Game::attempt(const string& guess) {
    if (solved) throw Already_solved();
    if (get_current_attempt() >= max_attempts) throw Max_attempts_reached();
    if (guess.length() != secret_word.length()) {
        throw std::invalid_argument("Word length does not match secret word length");
    }

    Word g(guess);
    Result r(secret_word, g);

    if (hard_mode) {
        for (size_t i = 0; i < g.length(); i++) {
            if (locked[i] && g[i] != secret_word[i]) throw Letter_locked();
        }
    }

    attempts.push_back(r);
    if (hard_mode) {
        for (size_t i = 0; i < r.size(); i++) {
            if (r.is_letter_present(i) && r.is_position_correct(i)) locked[i] = true;
        }
    }
    if (g == secret_word) solved = true;
    return r;
}

std::ostream& operator<<(std::ostream& os, Game::State s) {
    switch (s) {
    case Game::State::in_progress: return os << "in_progress";
    case Game::State::solved:      return os << "solved";
    case Game::State::exhausted:   return os << "exhausted";
    }
    return os << "unknown";
}

namespace {
    // runs f, which must throw E, and returns the message
    template <typename E, typename F>
    string expect_throw(const string& what, F f) {
        try {
            f();
        } catch (const E& e) {
            return e.what();
        }
        throw std::runtime_error("Game::test() failed, no exception from: " + what);
    }

    string locked_string(const vector<bool>& locked) {
        string s;
        for (bool b : locked) s.push_back(b ? 'x' : '-');
        return s;
    }
}

void Game::test(const string& words_file) {
    std::shared_ptr<const Dictionary> dict = std::make_shared<Dictionary>(words_file);

    Options valid;
    valid.secret_word = "valid";
    Game g1(valid, dict);
    string m = expect_throw<std::invalid_argument>("INVALID vs VALID", [&]() { g1.attempt("INVALID"); });
    std::stringstream output1;
    output1 << g1.get_max_attempts() << " " << g1.get_current_attempt() << " " << g1.get_state() << " " << m;
    if (output1.str() != "6 0 in_progress Word length does not match secret word length") {
        throw std::runtime_error("Game::test() 1 failed, got " + output1.str());
    }

    Options too_short;
    too_short.secret_word = "wow";
    Options too_long;
    too_long.secret_word = "invalid";
    Options made_up;
    made_up.min_length = 8;
    made_up.max_length = 8;
    made_up.secret_word = "fizzbuzz";
    std::stringstream output2;
    output2 << expect_throw<std::invalid_argument>("wow", [&]() { Game g(too_short, dict); }) << std::endl
            << expect_throw<std::invalid_argument>("invalid", [&]() { Game g(too_long, dict); }) << std::endl
            << expect_throw<std::invalid_argument>("fizzbuzz", [&]() { Game g(made_up, dict); }) << std::endl;
    std::stringstream expected2;
    expected2 << "Secret word must be between min_length and max_length" << std::endl
              << "Secret word must be between min_length and max_length" << std::endl
              << "Secret word must be a valid word in the dictionary" << std::endl;
    if (output2.str() != expected2.str()) {
        throw std::runtime_error("Game::test() 2 failed, got\n" + output2.str());
    }

    // a random secret, checked position by position
    Options random;
    random.debug = true;
    Game g3(random, dict);
    const Word& secret = g3.get_secret_word();
    if (secret.length() != 5 || !dict->is_word(secret)) {
        throw std::runtime_error("Game::test() 3 failed, bad secret " + secret.str());
    }
    Result r3 = g3.attempt("aeiou");
    if (r3.size() != secret.length()) {
        throw std::runtime_error("Game::test() 3 failed, wrong result size");
    }
    for (size_t i = 0; i < r3.size(); i++) {
        char c = "AEIOU"[i];
        if (r3.get_letter(i) != c
            || r3.is_position_correct(i) != (secret[i] == c)
            || r3.is_letter_present(i) != (secret.str().find(c) != string::npos)) {
            throw std::runtime_error("Game::test() 3 failed for " + secret.str() + " at " + boost::lexical_cast<string>(i));
        }
    }
    if (g3.get_current_attempt() != 1 || g3.get_attempts().size() != 1 || g3.get_attempts()[0] != r3) {
        throw std::runtime_error("Game::test() 3 failed, attempt not recorded");
    }

    std::stringstream output4;
    for (size_t len = 2; len <= 6; len++) {
        output4 << get_max_attempts_for_length(len, false) << get_max_attempts_for_length(len, true) << " ";
    }
    Options hard_apple;
    hard_apple.secret_word = "APPLE";
    hard_apple.hard_mode = true;
    output4 << Game(hard_apple, dict).get_max_attempts() << Game(valid, dict).get_max_attempts();
    if (output4.str() != "34 45 56 67 78 76") {
        throw std::runtime_error("Game::test() 4 failed, got " + output4.str());
    }

    // exact match, any case
    Options apple;
    apple.secret_word = "apple";
    Game g5(apple, dict);
    Result r5a = g5.attempt("PAPER");
    Result r5b = g5.attempt("PAPER");
    Result r5c = g5.attempt("aPpLe");
    string m5 = expect_throw<Already_solved>("attempt after solved", [&]() { g5.attempt("apple"); });
    std::stringstream output5;
    output5 << r5a.to_string() << " " << (r5a == r5b) << " " << r5c.to_string() << " "
            << g5.is_solved() << " " << g5.get_state() << " " << g5.get_current_attempt() << " " << m5;
    if (output5.str() != "PAPER ~~.~_ 1 APPLE ..... 1 solved 3 You have already solved this word!") {
        throw std::runtime_error("Game::test() 5 failed, got " + output5.str());
    }

    // running out of attempts
    Game g6(apple, dict);
    for (int i = 0; i < g6.get_max_attempts(); i++) {
        if (g6.get_state() != State::in_progress) {
            throw std::runtime_error("Game::test() 6 failed, game over too early");
        }
        g6.attempt("paper");
    }
    string m6 = expect_throw<Max_attempts_reached>("attempt after the last", [&]() { g6.attempt("paper"); });
    expect_throw<Max_attempts_reached>("solving after the last", [&]() { g6.attempt("apple"); });
    std::stringstream output6;
    output6 << g6.get_current_attempt() << " " << g6.get_attempts().size() << " " << g6.is_solved() << " "
            << g6.get_state() << " " << m6;
    if (output6.str() != "6 6 0 exhausted You have reached the maximum number of attempts") {
        throw std::runtime_error("Game::test() 6 failed, got " + output6.str());
    }

    // hard mode: locks only accumulate, and a bad guess is not recorded
    Game g7(hard_apple, dict);
    std::stringstream output7;
    g7.attempt("PAPER");
    output7 << locked_string(g7.get_locked_positions()) << " ";
    string m7 = expect_throw<Letter_locked>("ZZZZZ after PAPER", [&]() { g7.attempt("ZZZZZ"); });
    output7 << g7.get_current_attempt() << " ";
    g7.attempt("zzpzz");
    output7 << locked_string(g7.get_locked_positions()) << " ";
    g7.attempt("AZPZZ");
    output7 << locked_string(g7.get_locked_positions()) << " ";
    expect_throw<Letter_locked>("ZZPZZ after AZPZZ", [&]() { g7.attempt("ZZPZZ"); });
    g7.attempt("AZPZA");
    output7 << locked_string(g7.get_locked_positions()) << " " << g7.get_current_attempt() << " ";
    g7.attempt("apple");
    output7 << g7.is_solved() << " " << m7;
    if (output7.str() != "--x-- 1 --x-- x-x-- x-x-- 4 1 You cannot change a letter that is in the correct position") {
        throw std::runtime_error("Game::test() 7 failed, got " + output7.str());
    }

    // outside hard mode a correct letter can be moved
    Game g8(apple, dict);
    g8.attempt("PAPER");
    g8.attempt("ZZZZZ");
    if (g8.get_current_attempt() != 2 || locked_string(g8.get_locked_positions()) != "-----") {
        throw std::runtime_error("Game::test() 8 failed");
    }

    string m9 = expect_throw<Secret_hidden>("secret without debug", [&]() { g8.get_secret_word(); });
    if (m9 != "Secret word is only available in debug mode") {
        throw std::runtime_error("Game::test() 9 failed, got " + m9);
    }

    expect_throw<std::invalid_argument>("non-letter guess", [&]() { g8.attempt("APP1E"); });
    if (g8.get_current_attempt() != 2) {
        throw std::runtime_error("Game::test() 10 failed, a bad guess was recorded");
    }

    Options sixteen;
    sixteen.min_length = 16;
    sixteen.max_length = 16;
    expect_throw<Dictionary::No_matching_words>("16 letter secret", [&]() { Game g(sixteen, dict); });

    // no dictionary given: the default one, located through WORDMM_DICTIONARY.
    // Other WORDMM_ variables in the environment must not get in the way.
    Scoped_env dictionary_env("WORDMM_DICTIONARY", words_file);
    Scoped_env unrelated_env("WORDMM_NOT_AN_OPTION", "ignored");
    Options defaults;
    defaults.min_length = 3;
    defaults.max_length = 7;
    defaults.debug = true;
    Game g12(defaults);
    const Word& s12 = g12.get_secret_word();
    if (s12.length() < 3 || s12.length() > 7 || !g12.get_dictionary().is_word(s12)
        || g12.get_max_attempts() != static_cast<int>(s12.length()) + 1) {
        throw std::runtime_error("Game::test() 12 failed, got " + s12.str());
    }
}
