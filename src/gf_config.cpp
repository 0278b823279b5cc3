/*
 *  ghostfield
 *
 *  c++ version of the ghost honeypot field handler
 *  hardens html form submissions against bots by adding honeypot fields,
 *  obfuscating all field names per hour and an optional javascript handshake.
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

#include <string>
#include <vector>

// YAML
#include <yaml-cpp/yaml.h>

// BOOST
#include <boost/foreach.hpp>

#define BOOST_FILESYSTEM_VERSION 3
#define BOOST_FILESYSTEM_NO_DEPRECATED
#include <boost/filesystem.hpp>

#include "gf_config.h"

namespace fs = boost::filesystem;
using namespace std;


/*
 * a field entry is either a plain name or a list [name, type, placeholder],
 * type and placeholder may be left out
 */
static GfFieldSpec parse_field(const YAML::Node &entry, const bool legit, const string &section)
{
    GfFieldSpec spec;
    spec.legit = legit;
    if (entry.IsScalar()) {
        spec.name = entry.as<string>();
    } else if (entry.IsSequence() && entry.size() > 0) {
        spec.name = entry[0].as<string>();
        spec.type = entry.size() > 1 ? entry[1].as<string>("") : "";
        spec.placeholder = entry.size() > 2 ? entry[2].as<string>("") : "";
    } else {
        throw GfConfigError("invalid entry in " + section + ", use a name or [name, type, placeholder]");
    }
    return spec;
}

static vector<GfFieldSpec> parse_fields(const YAML::Node &list, const bool legit, const string &section)
{
    vector<GfFieldSpec> specs;
    if (!list.IsSequence()) {
        throw GfConfigError(section + " has to be a list");
    }
    BOOST_FOREACH(const YAML::Node &entry, list) {
        specs.push_back(parse_field(entry, legit, section));
    }
    return specs;
}

GfConfig parse_config(const YAML::Node &config)
{
    GfConfig c;

    if (!config["key"]) {
        throw GfConfigError("no key in config");
    }
    // "key:" without a value is a weak but valid configuration
    c.key = config["key"].IsNull() ? "" : config["key"].as<string>();

    c.sigil = config["sigil"].as<string>("");

    string tz = config["timezone"].as<string>("local");
    if (tz == "utc" || tz == "UTC") {
        c.utc = true;
    } else if (tz == "local") {
        c.utc = false;
    } else {
        throw GfConfigError("timezone has to be local or utc, not " + tz);
    }

    if (config["honeypots"]) {
        c.honeypots = parse_fields(config["honeypots"], false, "honeypots");
    } else {
        c.honeypots = GhostField::default_fields();
    }
    if (config["legit"]) {
        c.legit = parse_fields(config["legit"], true, "legit");
    }

    return c;
}

GfConfig read_config(const string filename)
{
    return parse_config(YAML::LoadFile(filename));
}

GfConfig load_config(const string filename, const YAML::Node &overrides)
{
    YAML::Node config;
    if (fs::exists(filename)) {
        config = YAML::LoadFile(filename);
    } else if (!overrides["key"]) {
        throw GfConfigError("could not read config file " + filename);
    }
    for (YAML::const_iterator it = overrides.begin(); it != overrides.end(); ++it) {
        config[it->first.as<string>()] = it->second;
    }
    return parse_config(config);
}

void setup_fields(GhostField &gf, const GfConfig &config)
{
    gf.create_fields(config.honeypots);
    gf.create_fields(config.legit);
    if (!config.sigil.empty()) {
        if (!gf.set_sigil(config.sigil)) {
            throw GfConfigError("invalid sigil name " + config.sigil);
        }
    }
}
