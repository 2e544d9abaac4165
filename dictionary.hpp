/* The set of valid words. Words are normalized to upper case on the way in and
   bucketed by length so a random word in a length range can be drawn from
   exactly the words that qualify.

   A Dictionary never changes once constructed, so one instance can be shared
   (through a shared_ptr<const Dictionary>) by any number of games and threads.
*/

#pragma once
#include <map>
#include <set>
#include <vector>
#include <memory>
#include <random>
#include <stdexcept>
#include "word.hpp"

class Dictionary {
public:
    class No_matching_words : public std::runtime_error {
    public:
        No_matching_words() : std::runtime_error("Dictionary doesn't seem to have any words of the requested parameters") {}
    };

    // one word per line. Throws std::runtime_error if the file can't be read,
    // has a malformed line or has no words at all.
    explicit Dictionary(const std::string& filename);
    Dictionary(std::istream& in, const std::string& source_name);
    explicit Dictionary(const std::vector<std::string>& words);

    // Loaded once per process from Settings::from_environment().dictionary_file.
    static std::shared_ptr<const Dictionary> default_dictionary();

    bool is_word(const std::string& w) const;
    bool is_word(const Word& w) const;

    // uniform over the words with min_length <= length <= max_length,
    // throws No_matching_words if there are none
    Word get_random_word(size_t min_length, size_t max_length) const;
    Word get_random_word(size_t min_length, size_t max_length, std::mt19937& rng) const;

    size_t count_in_range(size_t min_length, size_t max_length) const;
    size_t size() const { return words.size(); }

    static void test(const std::string& words_file);
private:
    void load(std::istream& in, const std::string& source_name);
    void add_entry(const std::string& entry, const std::string& source_name, size_t line_number);
    void check_not_empty(const std::string& source_name) const;

    std::set<Word> words;
    std::map<size_t, std::vector<Word>> words_by_length;
};
