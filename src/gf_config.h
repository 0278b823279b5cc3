#ifndef GF_CONFIG_H
#define GF_CONFIG_H

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

#include <stdexcept>
#include <string>
#include <vector>

// YAML
#include <yaml-cpp/yaml.h>

#include "ghostfield.h"

using namespace std;

const string GF_CONFIG_FILE = "/etc/ghostfield.conf";

class GfConfigError : public runtime_error {
public:
    explicit GfConfigError(const string &what) : runtime_error(what) {}
};

/*
 * contents of /etc/ghostfield.conf
 *
 *   key: application secret (required)
 *   sigil: name of the sigil field, no sigil if missing
 *   timezone: local or utc
 *   honeypots: list of [name, type, placeholder] or names, default catalog if missing
 *   legit: list of [name, type, placeholder] or names
 */
struct GfConfig {
    string key;
    string sigil;
    bool utc;
    vector<GfFieldSpec> honeypots;
    vector<GfFieldSpec> legit;
};

GfConfig parse_config(const YAML::Node &config);
GfConfig read_config(const string filename = GF_CONFIG_FILE);

/*
 * read the config file and apply command line overrides on top of it,
 * a missing file is only accepted if the overrides carry a key
 */
GfConfig load_config(const string filename, const YAML::Node &overrides);

// populate a registry from the config: honeypots, legit fields, sigil
void setup_fields(GhostField &gf, const GfConfig &config);

#endif
