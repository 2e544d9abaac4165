#include <sstream>
#include <boost/algorithm/string/case_conv.hpp>
#include "settings.hpp"
#include "scoped_env.hpp"

#ifndef WORDMM_DEFAULT_DICTIONARY
  #define WORDMM_DEFAULT_DICTIONARY "words.txt"
#endif

namespace po = boost::program_options;

using std::string;

const char* const Settings::env_prefix = "WORDMM_";

Settings::Settings() : dictionary_file(WORDMM_DEFAULT_DICTIONARY), debug(false) {}

po::options_description Settings::options(Settings& s) {
    po::options_description desc("Word MasterMind settings");
    desc.add_options()
        ("dictionary", po::value<string>(&s.dictionary_file)->default_value(s.dictionary_file), "word list, one word per line")
        ("debug",      po::value<bool>(&s.debug)->default_value(s.debug),                       "allow reading the secret word");
    return desc;
}

Settings Settings::from_environment() {
    Settings s;
    po::options_description desc = options(s);
    po::variables_map vm;
    // WORDMM_DICTIONARY -> dictionary. Variables that aren't options map to "" and are skipped.
    const string prefix(env_prefix);
    po::store(po::parse_environment(desc, [&desc, &prefix](const string& var) -> string {
        if (var.compare(0, prefix.length(), prefix) != 0) return "";
        string name = boost::algorithm::to_lower_copy(var.substr(prefix.length()));
        return desc.find_nothrow(name, false) ? name : "";
    }), vm);
    po::notify(vm);
    return s;
}

Settings Settings::from_stream(std::istream& in) {
    Settings s;
    po::options_description desc = options(s);
    po::variables_map vm;
    po::store(po::parse_config_file(in, desc), vm);
    po::notify(vm);
    return s;
}

void Settings::test() {
    std::stringstream output1;
    Settings d;
    output1 << d.dictionary_file << " " << d.debug;
    if (output1.str() != string(WORDMM_DEFAULT_DICTIONARY) + " 0") {
        throw std::runtime_error("Settings::test() 1 failed, got " + output1.str());
    }

    std::stringstream config("# test settings\ndictionary = /tmp/some-words.txt\ndebug = true\n");
    Settings f = from_stream(config);
    std::stringstream output2;
    output2 << f.dictionary_file << " " << f.debug;
    if (output2.str() != "/tmp/some-words.txt 1") {
        throw std::runtime_error("Settings::test() 2 failed, got " + output2.str());
    }

    {
        Scoped_env e1("WORDMM_DICTIONARY", "/tmp/env-words.txt");
        Scoped_env e2("WORDMM_DEBUG", "yes");
        Scoped_env e3("WORDMM_NOT_AN_OPTION", "ignored");
        Settings e = from_environment();
        std::stringstream output3;
        output3 << e.dictionary_file << " " << e.debug;
        if (output3.str() != "/tmp/env-words.txt 1") {
            throw std::runtime_error("Settings::test() 3 failed, got " + output3.str());
        }
    }
    if (getenv("WORDMM_NOT_AN_OPTION")) {
        throw std::runtime_error("Settings::test() 3 failed, WORDMM_NOT_AN_OPTION left behind");
    }

    {
        Scoped_env e1("WORDMM_DEBUG", "maybe");
        bool threw = false;
        try {
            from_environment();
        } catch (const po::error&) {
            threw = true;
        }
        if (!threw) {
            throw std::runtime_error("Settings::test() 4 failed, accepted WORDMM_DEBUG=maybe");
        }
    }

    std::stringstream bad_config("colour = blue\n");
    bool threw = false;
    try {
        from_stream(bad_config);
    } catch (const po::error&) {
        threw = true;
    }
    if (!threw) {
        throw std::runtime_error("Settings::test() 5 failed, accepted an unknown option");
    }
}
