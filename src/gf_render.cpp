/*
 *  ghostfield
 *
 *  gf_render
 *
 *  c++ version of the ghost honeypot field handler
 *  hardens html form submissions against bots by adding honeypot fields,
 *  obfuscating all field names per hour and an optional javascript handshake.
 *
 *  prints the trap inputs, the hiding script or the wire ids of the
 *  current hour, for templates which are not rendered by a c++ program.
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
#include <stdexcept>
#include <string>
#include <ctime>
#include <syslog.h>

// YAML
#include <yaml-cpp/yaml.h>

#include <boost/program_options.hpp>
#include <boost/foreach.hpp>

#include "ghostfield.h"
#include "gf_config.h"
#include "gf_markup.h"

namespace po = boost::program_options;
using namespace std;


/*
 *  parse the commandline, options given here override the config file
 */
void commandline(po::variables_map &opt, string &configfile, YAML::Node &overrides, long &now,
                 int argc, char**argv) {
    string key, sigil;

    po::options_description cmd_options( "\nOptions" );
    cmd_options.add_options()
            ("help,h", "produce help message")
            ("version,V", "show version")
            ("config,c", po::value<string>(&configfile)->default_value(GF_CONFIG_FILE), "config file")
            ("key,k", po::value<string>(&key), "secret key, overrides config")
            ("sigil,s", po::value<string>(&sigil), "enable javascript check with this sigil name")
            ("now,t", po::value<long>(&now), "unix time to use instead of the clock")
            ("utc,u", "use UTC for the hour buckets")
            ("html", "print honeypot inputs (default)")
            ("js", "print script hiding the honeypots")
            ("ids", "print wire ids of all fields as YAML")
    ;

    po::options_description secret_options("Secret");
    secret_options.add_options()
        ("debug", "show debugging information")
        ;

    po::options_description all_options;
    all_options.add(cmd_options).add(secret_options);

    // parse commandline
    try{
        po::store(po::command_line_parser(argc, argv).options(all_options).run(), opt);
        po::notify(opt);
    } catch (const po::error &e) {
        cerr << "Error: " << e.what() << endl;
        cout << "Usage: " << argv[0] << ": [options]" << endl;
        cout << cmd_options << "\n";
        exit(1);
    }

    if (opt.count("help")) {
        cout << "Usage: " << argv[0] << ": [options]" << endl;
        cout << cmd_options << "\n";
        exit(1);
    }

    if (opt.count("version")) {
        cout << "ghostfield version " << GF_VERSION << endl;
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
    string configfile;
    YAML::Node overrides;
    long now = time(NULL);
    po::variables_map opt;

    commandline(opt, configfile, overrides, now, argc, argv);

    openlog("gf_render", 0, LOG_USER); // SYSLOG

    GfConfig config;
    try {
        config = load_config(configfile, overrides);
    } catch (const GfConfigError &e) {
        cerr << "Error: " << e.what() << endl;
        exit(-1);
    } catch (const YAML::Exception &e) {
        cerr << "Error: Could not read config file!" << endl;
        cerr << e.what() << endl;
        exit(-1);
    }
    if (config.key.empty()) {
        cerr << "Warning: empty secret key, field names can be predicted!" << endl;
    }

    try {
        GhostField gf(config.key, static_cast<time_t>(now), config.utc);
        setup_fields(gf, config);

        if (opt.count("debug")) {
            cerr << "debug: hour bucket " << gf.get_timestamp() << endl;
            cerr << "debug: " << gf.get_fields().size() << " fields" << endl;
        }

        if (opt.count("ids")) {
            YAML::Node ids;
            BOOST_FOREACH(const GfField &field, gf.get_fields()) {
                ids[field.getname()] = field.getid();
            }
            cout << ids << endl;
        } else if (opt.count("js")) {
            cout << render_hide_js(gf);
        } else {
            cout << render_honeypots(gf);
        }
    } catch (const runtime_error &e) {
        cerr << "Error: " << e.what() << endl;
        exit(-1);
    }

    return 0;
}
