#include <fstream>
#include <sstream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/lexical_cast.hpp>
#include "dictionary.hpp"
#include "settings.hpp"
#include "scoped_env.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::endl;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;

// not set externally, only used for the test.
static bool silence = false;

Dictionary::Dictionary(const string& filename) {
    ptime start = microsec_clock::local_time();
    std::ifstream f(filename.c_str());
    if (!f) {
        throw std::runtime_error("Can't open dictionary file: " + filename);
    }
    load(f, filename);
    if (!silence) {
        cerr << "Loaded " << words.size() << " words from dictionary: " << filename
             << ", took " << (microsec_clock::local_time() - start).total_microseconds() / 1e6 << "s" << endl;
    }
}

Dictionary::Dictionary(std::istream& in, const string& source_name) {
    load(in, source_name);
    if (!silence) cerr << "Loaded " << words.size() << " words from " << source_name << endl;
}

Dictionary::Dictionary(const vector<string>& entries) {
    for (size_t i = 0; i < entries.size(); i++) {
        add_entry(entries[i], "word list", i + 1);
    }
    check_not_empty("word list");
}

void Dictionary::load(std::istream& in, const string& source_name) {
    string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        line_number++;
        add_entry(line, source_name, line_number);
    }
    if (in.bad()) {
        throw std::runtime_error("Error reading dictionary: " + source_name);
    }
    check_not_empty(source_name);
}

// blank lines, # comments and single letters are skipped, anything else must be a word
void Dictionary::add_entry(const string& entry, const string& source_name, size_t line_number) {
    const char* whitespace = " \t\r\n";
    size_t first = entry.find_first_not_of(whitespace);
    if (first == string::npos) return;
    size_t last = entry.find_last_not_of(whitespace);
    string w = entry.substr(first, last - first + 1);

    if (w[0] == '#' || w.length() < 2) return;
    if (!Word::is_valid(w)) {
        throw std::runtime_error("Malformed dictionary entry at " + source_name + ":"
                                 + boost::lexical_cast<string>(line_number) + ": " + w);
    }

    Word word(w);
    if (words.insert(word).second) {
        words_by_length[word.length()].push_back(word);
    }
}

void Dictionary::check_not_empty(const string& source_name) const {
    if (words.empty()) {
        throw std::runtime_error("No words found in dictionary: " + source_name);
    }
}

std::shared_ptr<const Dictionary> Dictionary::default_dictionary() {
    static std::shared_ptr<const Dictionary> dict(
        std::make_shared<Dictionary>(Settings::from_environment().dictionary_file));
    return dict;
}

bool Dictionary::is_word(const string& w) const {
    return Word::is_valid(w) && is_word(Word(w));
}

bool Dictionary::is_word(const Word& w) const {
    return words.count(w) > 0;
}

size_t Dictionary::count_in_range(size_t min_length, size_t max_length) const {
    size_t n = 0;
    for (auto it = words_by_length.lower_bound(min_length);
         it != words_by_length.end() && it->first <= max_length; ++it) {
        n += it->second.size();
    }
    return n;
}

Word Dictionary::get_random_word(size_t min_length, size_t max_length) const {
    static thread_local std::mt19937 rng(std::random_device{}());
    return get_random_word(min_length, max_length, rng);
}

// draw an index over all qualifying words, then walk the length buckets to find it
Word Dictionary::get_random_word(size_t min_length, size_t max_length, std::mt19937& rng) const {
    size_t n = count_in_range(min_length, max_length);
    if (n == 0) {
        throw No_matching_words();
    }
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    size_t i = dist(rng);
    for (auto it = words_by_length.lower_bound(min_length);
         it != words_by_length.end() && it->first <= max_length; ++it) {
        if (i < it->second.size()) return it->second[i];
        i -= it->second.size();
    }
    throw std::logic_error("Dictionary::get_random_word: index past the end of the length buckets");
}

void Dictionary::test(const string& words_file) {
    Dictionary d(words_file);

    std::stringstream output1;
    output1 << d.is_word("hello") << d.is_word("world") << d.is_word("SCRABBLE") << d.is_word("Valid") << " "
            << d.is_word("") << d.is_word("wordle") << d.is_word("z") << d.is_word("zzzzzzzzzzzzz")
            << d.is_word("hello world") << d.is_word("he11o");
    if (output1.str() != "1111 000000") {
        throw std::runtime_error("Dictionary::test() 1 failed, got " + output1.str());
    }

    for (int i = 0; i < 10; i++) {
        Word w = d.get_random_word(3, 5);
        if (w.length() < 3 || w.length() > 5 || !d.is_word(w) || !d.is_word(w.str())) {
            throw std::runtime_error("Dictionary::test() 2 failed, got " + w.str());
        }
    }

    bool threw = false;
    try {
        d.get_random_word(16, 16);
    } catch (const No_matching_words& e) {
        threw = string(e.what()) == "Dictionary doesn't seem to have any words of the requested parameters";
    }
    if (!threw) {
        throw std::runtime_error("Dictionary::test() 3 failed, no exhaustion error for length 16");
    }

    threw = false;
    try {
        Dictionary missing("/nonexistent/wordmm/words.txt");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        throw std::runtime_error("Dictionary::test() 4 failed, loaded a missing file");
    }

    // the switch comes back even when a test in between throws
    try {
        Scoped_flag quiet(silence, true);
        throw std::runtime_error("expected");
    } catch (const std::runtime_error&) {
    }
    if (silence) {
        throw std::runtime_error("Dictionary::test() 5 failed, silence left on");
    }

    Scoped_flag quiet(silence, true);

    std::stringstream list("# fruit\n  apple \r\nApple\n\nx\nPAPER\n");
    Dictionary s(list, "list");
    std::stringstream output5;
    output5 << s.size() << " " << s.count_in_range(5, 5) << s.count_in_range(1, 4) << s.count_in_range(6, 2) << " "
            << s.is_word("APPLE") << s.is_word("x");
    if (output5.str() != "2 200 10") {
        throw std::runtime_error("Dictionary::test() 5 failed, got " + output5.str());
    }

    std::stringstream malformed("apple\nbad-word\n");
    string message;
    try {
        Dictionary m(malformed, "malformed");
    } catch (const std::runtime_error& e) {
        message = e.what();
    }
    if (message.find("malformed:2:") == string::npos) {
        throw std::runtime_error("Dictionary::test() 6 failed, got '" + message + "'");
    }

    std::stringstream empty("# nothing here\n\n");
    threw = false;
    try {
        Dictionary e(empty, "empty");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        throw std::runtime_error("Dictionary::test() 7 failed, accepted an empty dictionary");
    }

    // draws come from exactly the words in range, and all of them turn up
    Dictionary small(vector<string>{ "ab", "cat", "dogs", "horse" });
    std::mt19937 rng(42);
    std::map<string, int> seen;
    for (int i = 0; i < 200; i++) {
        seen[small.get_random_word(3, 4, rng).str()]++;
    }
    if (seen.size() != 2 || !seen.count("CAT") || !seen.count("DOGS")) {
        throw std::runtime_error("Dictionary::test() 8 failed, drew outside 3..4");
    }

    std::mt19937 rng1(7);
    std::mt19937 rng2(7);
    for (int i = 0; i < 20; i++) {
        if (small.get_random_word(2, 5, rng1) != small.get_random_word(2, 5, rng2)) {
            throw std::runtime_error("Dictionary::test() 9 failed, seeded draws differ");
        }
    }

    threw = false;
    try {
        small.get_random_word(5, 3, rng);
    } catch (const No_matching_words&) {
        threw = true;
    }
    if (!threw) {
        throw std::runtime_error("Dictionary::test() 10 failed, drew from an inverted range");
    }

}
