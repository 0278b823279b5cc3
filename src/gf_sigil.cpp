/*
 *  ghostfield
 *
 *  gf_sigil
 *
 *  c++ version of the ghost honeypot field handler
 *  hardens html form submissions against bots by adding honeypot fields,
 *  obfuscating all field names per hour and an optional javascript handshake.
 *
 *  computes what the browser puts into the sigil field, to test a form
 *  without a browser or to compare with a client implementation.
 *
 *  (c) the ghostfield authors 2025
 *
 *  ghostfield is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  ghostfield is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with ghostfield.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <boost/program_options.hpp>

#include "gf_util.h"

namespace po = boost::program_options;
using namespace std;


/*
 *  parse the commandline and see if all required arguments are passed
 */
void commandline(po::variables_map &opt, string &useragent, string &timevalue, string &hashinput,
                 int argc, char**argv) {
    // define all options

    po::options_description cmd_options( "\nOptions" );
    cmd_options.add_options()
            ("help,h", "produce help message")
            ("user-agent,A", po::value<string>(&useragent), "User-Agent of the browser")
            ("time,t", po::value<string>(&timevalue), "value of the <sigil>_time field")
            ("fnv", po::value<string>(&hashinput), "print FNV-1a/32 of a string")
    ;

    // parse commandline
    try{
        po::store(po::command_line_parser(argc, argv).options(cmd_options).run(), opt);
        po::notify(opt);
    } catch (const po::error &e) {
        cerr << "Error: " << e.what() << endl;
        cout << "Usage:" << argv[0] << ": [options] -A user_agent -t time_value" << endl;
        cout << cmd_options << "\n";
        exit(1);
    }

    // see whats up

    if (opt.count("help")) {
        cout << "Usage:" << argv[0] << ": [options] -A user_agent -t time_value" << endl;
        cout << cmd_options << "\n";
        exit(1);
    }

    if (!opt.count("fnv") && !opt.count("time")) {
        cout << "Usage:" << argv[0] << ": [options] -A user_agent -t time_value" << endl;
        cout << cmd_options << "\n";
        exit(1);
    }
}


/*
 *  main logic here
 */

int main(int argc, char **argv) {
    string useragent, timevalue, hashinput;
    po::variables_map opt;

    // check commandline
    commandline(opt, useragent, timevalue, hashinput, argc, argv);

    if (opt.count("fnv")) {
        cout << fnv1a32(hashinput) << endl;
    } else {
        cout << sigil_proof(useragent, timevalue) << endl;
    }

    return 0;
}
