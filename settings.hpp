/* Process configuration. Every option can come from the environment
   (WORDMM_<OPTION>, eg. WORDMM_DICTIONARY) or from a config file with
   "option = value" lines. Unset options keep their defaults.
*/

#pragma once
#include <string>
#include <iostream>
#include <boost/program_options.hpp>

class Settings {
public:
    Settings();

    // throws boost::program_options::error on a bad value
    static Settings from_environment();
    static Settings from_stream(std::istream& in);

    // the options, bound to the fields of [s], for front ends that want to
    // put them on their own command line
    static boost::program_options::options_description options(Settings& s);

    std::string dictionary_file;
    bool debug; // reveals the secret word

    static const char* const env_prefix;

    static void test();
};
