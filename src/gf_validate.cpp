/*
 *  ghostfield
 *
 *  gf_validate
 *
 *  c++ version of the ghost honeypot field handler
 *  hardens html form submissions against bots by adding honeypot fields,
 *  obfuscating all field names per hour and an optional javascript handshake.
 *
 *  reads an urlencoded form body, checks honeypots and sigil and prints the
 *  legit data as YAML. exit code 0 accepted, 2 rejected, 1 usage error.
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
#include <fstream>
#include <map>
#include <stdexcept>
#include <sstream>
#include <string>
#include <ctime>
#include <syslog.h>

// YAML
#include <yaml-cpp/yaml.h>

#include <boost/program_options.hpp>
#include <boost/foreach.hpp>

#define BOOST_FILESYSTEM_VERSION 3
#define BOOST_FILESYSTEM_NO_DEPRECATED
#include <boost/filesystem.hpp>

#include "ghostfield.h"
#include "gf_config.h"
#include "gf_util.h"

namespace fs = boost::filesystem;
namespace po = boost::program_options;
using namespace std;


/*
 *  parse the commandline and see if all required arguments are passed
 */
void commandline(po::variables_map &opt, string &configfile, YAML::Node &overrides, long &now,
                 string &useragent, string &input, int argc, char**argv) {
    string key, sigil;

    po::options_description cmd_options( "\nOptions" );
    cmd_options.add_options()
            ("help,h", "produce help message")
            ("version,V", "show version")
            ("config,c", po::value<string>(&configfile)->default_value(GF_CONFIG_FILE), "config file")
            ("key,k", po::value<string>(&key), "secret key, overrides config")
            ("sigil,s", po::value<string>(&sigil), "javascript check with this sigil name")
            ("now,t", po::value<long>(&now), "unix time to use instead of the clock")
            ("utc,u", "use UTC for the hour buckets")
            ("user-agent,A", po::value<string>(&useragent), "User-Agent header of the request")
            ("input,i", po::value<string>(&input), "file with the form body, stdin if missing")
    ;

    po::options_description secret_options("Secret");
    secret_options.add_options()
        ("debug", "show debugging information")
        ;

    // define options without names
    po::positional_options_description p;
    p.add("input", 1);

    po::options_description all_options;
    all_options.add(cmd_options).add(secret_options);

    // parse commandline
    try{
        po::store(po::command_line_parser(argc, argv).options(all_options).positional(p).run(), opt);
        po::notify(opt);
    } catch (const po::error &e) {
        cerr << "Error: " << e.what() << endl;
        cout << "Usage: " << argv[0] << ": [options] [form_body_file]" << endl;
        cout << cmd_options << "\n";
        exit(1);
    }

    // see whats up

    if (opt.count("help")) {
        cout << "Usage: " << argv[0] << ": [options] [form_body_file]" << endl;
        cout << cmd_options << "\n";
        exit(1);
    }

    if (opt.count("version")) {
        cout << "ghostfield version " << GF_VERSION << endl;
        exit(1);
    }

    if (!opt.count("user-agent")) {
        cerr << "Info: no user agent given, checking with empty user agent." << endl;
    }

    if (opt.count("input") && !fs::exists(input)) {
        cerr << "Error: input file <" << input << "> does not exist!" << endl;
        exit(1);
    }

    if (opt.count("key")) overrides["key"] = key;
    if (opt.count("sigil")) overrides["sigil"] = sigil;
    if (opt.count("utc")) overrides["timezone"] = "utc";
}


/*
 *  main logic here
 */

int main(int argc, char **argv) {
    string configfile, useragent, input;
    YAML::Node overrides;
    long now = time(NULL);
    po::variables_map opt;

    commandline(opt, configfile, overrides, now, useragent, input, argc, argv);

    openlog("gf_validate", 0, LOG_USER); // SYSLOG

    GfConfig config;
    try {
        config = load_config(configfile, overrides);
    } catch (const GfConfigError &e) {
        cerr << "Error: " << e.what() << endl;
        exit(1);
    } catch (const YAML::Exception &e) {
        cerr << "Error: Could not read config file!" << endl;
        cerr << e.what() << endl;
        exit(1);
    }
    if (config.key.empty()) {
        cerr << "Warning: empty secret key, field names can be predicted!" << endl;
    }

    // read form body
    stringstream body;
    if (opt.count("input")) {
        ifstream t(input.c_str());
        body << t.rdbuf();
    } else {
        body << cin.rdbuf();
    }
    FormData form = parse_urlencoded(body.str());

    try {
        GhostField gf(config.key, static_cast<time_t>(now), config.utc);
        setup_fields(gf, config);
        bool ok = gf.validate(form, useragent);

        if (opt.count("debug")) {
            BOOST_FOREACH(const string &ts, gf.get_timestamps()) {
                cerr << "debug: accepting hour bucket " << ts << endl;
            }
            cerr << "debug: " << form.size() << " submitted values" << endl;
        }

        if (!ok) {
            cerr << "Info: submission rejected." << endl;
            syslog(LOG_INFO, "rejected submission with user agent <%s>.", useragent.c_str());
            return 2;
        }

        YAML::Node data;
        map<string, string> legit = gf.get_data(form);
        for (map<string, string>::const_iterator it = legit.begin(); it != legit.end(); ++it) {
            data[it->first] = it->second;
        }
        cout << data << endl;
    } catch (const runtime_error &e) {
        cerr << "Error: " << e.what() << endl;
        exit(1);
    }

    return 0;
}
