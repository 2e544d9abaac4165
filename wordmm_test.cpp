#include <string>
#include <iostream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/program_options.hpp>
#include "word.hpp"
#include "result.hpp"
#include "dictionary.hpp"
#include "settings.hpp"
#include "game.hpp"

using std::string;
using std::cerr;
using std::endl;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    string dictionary_file;

    po::options_description desc("Run the Word MasterMind self tests");
    desc.add_options()
        ("dictionary,d", po::value<string>(&dictionary_file)->required(), "word list to test against")
        ("help,h",                                                       "produce help message");
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        if (vm.count("help")) {
            cerr << desc << endl;
            return 1;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        cerr << e.what() << endl << desc << endl;
        return 1;
    }

    ptime start = microsec_clock::local_time();
    try {
        Word::test();
        Result::test();
        Dictionary::test(dictionary_file);
        Game::test(dictionary_file);
        Settings::test();
    } catch (const std::exception& e) {
        cerr << e.what() << endl;
        return 1;
    }
    cerr << "All tests passed, took " << (microsec_clock::local_time() - start).total_microseconds() / 1e6 << "s" << endl;
    return 0;
}
