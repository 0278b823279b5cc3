#ifndef GHOSTFIELD_H
#define GHOSTFIELD_H

/*
 *  ghostfield
 *
 *  c++ version of the ghost honeypot field handler
 *  hardens html form submissions against bots by adding honeypot fields,
 *  obfuscating all field names per hour and an optional javascript handshake.
 *
 *  - honeypot fields: invisible trap inputs, if filled the submission is from a bot
 *  - field name obfuscation: every input name is a keyed hash changing each hour
 *  - sigil: optional javascript proof computed by the browser from user agent and time
 *
 *  this is no CAPTCHA and no anti forgery token, a bot running javascript
 *  and replaying within the same hour is not stopped.
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

// C++ stuff
#include <ctime>
#include <map>
#include <string>
#include <vector>

// BOOST
#include <boost/optional.hpp>

#include "gffield.h"
#include "gf_util.h"

using namespace std;


// declaration of a field for bulk creation
struct GfFieldSpec {
    bool legit;
    string name;
    string type;
    string placeholder;
};



/*
 * GhostField
 * the field registry of one form, built for one request.
 *
 * the time given at construction is the only clock used, all wire ids of an
 * instance belong to that hour. never share an instance between requests,
 * the wire ids of one visitor would leak to the next one.
 */
class GhostField {

private:
    string key;
    time_t now;
    bool utc;
    string timestamp;
    string sigilname;
    string sigiltime;

    // fields in insertion order, indexed by logical name and by current wire id
    vector<GfField> fields;
    map<string, size_t> byname;
    map<string, size_t> byid;

    string random_name(const string &name, const string &bucket = "") const;
    boost::optional<GfField> make_field(const bool legit, const string name, const string type,
                                        const string placeholder, const string value, const bool sigil);
    void store(const GfField &field);

public:

    static const string default_sigil_name;

    // built-in catalog of plausible honeypot fields
    static const vector<GfFieldSpec> &default_fields();

    // name pattern of logical field names
    static bool valid_name(const string &name);

    // key is the application secret, now defaults to the wall clock.
    // throws runtime_error if now can not be turned into an hour bucket
    GhostField(const string key, const time_t now = time(NULL), const bool utc = false);

    // enable the javascript handshake, a second call does nothing
    bool set_sigil(const string name = default_sigil_name);
    bool sigil_enabled() const;
    string get_sigil_name() const;

    // create fields, invalid names are skipped
    GhostField &create_fields(const vector<GfFieldSpec> &specs = default_fields());

    // create a single field, empty result if the name is invalid.
    // <sigil> and <sigil>_time are reserved once the sigil is enabled.
    boost::optional<GfField> create_field(const bool legit, const string name, const string type = "",
                                          const string placeholder = "");

    GhostField &add_legit(const string name, const string type = "", const string placeholder = "");
    GhostField &add_honeypot(const string name, const string type = "", const string placeholder = "");

    const vector<GfField> &get_fields() const;
    boost::optional<GfField> get_field(const string &name) const;
    boost::optional<GfField> get_field_by_id(const string &id) const;

    // wire id of a field, empty string if there is no such field
    string get_id(const string &name) const;

    time_t get_now() const;
    string get_timestamp() const;

    // hour buckets accepted on submission, current first
    vector<string> get_timestamps() const;

    string expected_proof(const string &useragent, const string &timevalue) const;

    // legit data of a submission by logical name
    map<string, string> get_data(const FormData &input) const;

    // false if a honeypot is filled or the sigil does not match
    bool validate(const FormData &data, const string &useragent) const;
};

#endif
