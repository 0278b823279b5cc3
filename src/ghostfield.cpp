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


#include <cstdio>
#include <string>
#include <vector>
#include <sys/time.h>
#include <syslog.h>

// BOOST
#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/foreach.hpp>

#include "ghostfield.h"

using boost::lexical_cast;

using namespace std;


const string GhostField::default_sigil_name = "sigil";

/*
 * honeypot names a form scraping bot likes to fill in,
 * they only have to look plausible
 */
const vector<GfFieldSpec> &GhostField::default_fields()
{
    static const vector<GfFieldSpec> catalog = {
        {false, "csrf_token", "text", "securized timestamp token"},
        {false, "internal_reference", "number", "User subscriber number"},
        {false, "order_date", "date", "Date of order"},
        {false, "user_date_of_birth", "date", "User date of birth"},
        {false, "user_subscriber_number", "text", "User subscriber number"},
        {false, "user_gender", "text", "User gender [male/female]"},
        {false, "user_first_name", "text", "User first name"},
        {false, "user_last_name", "text", "User last name"},
        {false, "user_middle_name", "text", "User middle name"},
        {false, "user_company", "text", "User company name"},
        {false, "user_email", "email", "User email"},
        {false, "user_password", "password", "User password"},
        {false, "user_password_confirm", "password", "User confirm password"},
        {false, "user_address", "text", "User main address"},
        {false, "user_city", "text", "User address city"},
        {false, "user_zip", "text", "User address zip code"},
        {false, "user_country", "text", "User address country"},
        {false, "user_phone_number", "tel", "User phone number"},
        {false, "user_fax_number", "tel", "User fax number"},
        {false, "user_mobile_number", "tel", "User mobile phone number"},
        {false, "user_linkedin_url", "text", "User LinkedIn Account"},
        {false, "user_facebook_url", "text", "User Facebook Account"},
        {false, "user_twitter_url", "text", "User Twitter/X Account"},
        {false, "user_bluesky_url", "text", "User Bluesky Account"},
        {false, "user_youtube_url", "text", "User YouTube Account"},
        {false, "search_query", "text", "Search query"},
        {false, "input_title", "text", "Selected title"},
        {false, "input_recipient", "text", "Selected recipient"},
        {false, "input_message", "text", "Your message here"},
        {false, "promotional_code", "text", "Set your promotional code here if needed"},
        {false, "sms_code_confirm", "text", "A code from SMS mobile phone number check"},
        {false, "rgpd_accept", "checkbox", "Accept the use of personal data"},
        {false, "third_party_cookies_accept", "checkbox", "Accept the use of third-party cookies"},
        {false, "adult_confirm", "checkbox", "Are you an adult (confirm 18+)"},
    };
    return catalog;
}

bool GhostField::valid_name(const string &name)
{
    static const boost::regex e("^[A-Za-z0-9_-]+$");
    return boost::regex_match(name, e);
}

/*
 * fix the time of this instance, everything else is derived from it.
 * a time outside the calendar throws runtime_error from time_bucket().
 */
GhostField::GhostField(const string _key, const time_t _now, const bool _utc)
    : key(_key), now(_now), utc(_utc)
{
    timestamp = time_bucket(now, utc);
    if (key.empty()) {
        syslog(LOG_WARNING, "empty secret key, field names can be predicted.");
    }
}

/*
 * wire id of a field for a bucket, the current one if none given
 */
string GhostField::random_name(const string &name, const string &bucket) const
{
    return derive_wire_id(name, key, bucket.empty() ? timestamp : bucket);
}

boost::optional<GfField> GhostField::make_field(const bool legit, const string name, const string type,
                                                const string placeholder, const string value, const bool sigil)
{
    if (!valid_name(name)) {
        syslog(LOG_DEBUG, "ignoring field with invalid name.");
        return boost::none;
    }
    map<string, size_t>::const_iterator it = byname.find(name);
    if (!sigil && it != byname.end() && fields[it->second].issigil()) {
        syslog(LOG_DEBUG, "field <%s> belongs to the sigil, not replaced.", name.c_str());
        return boost::none;
    }
    GfField field(name, random_name(name), legit, type, placeholder, value, sigil);
    store(field);
    return field;
}

/*
 * add a field, a field with the same name is replaced at its old position
 */
void GhostField::store(const GfField &field)
{
    map<string, size_t>::iterator it = byname.find(field.getname());
    if (it != byname.end()) {
        byid.erase(fields[it->second].getid());
        fields[it->second] = field;
        byid[field.getid()] = it->second;
    } else {
        fields.push_back(field);
        byname[field.getname()] = fields.size()-1;
        byid[field.getid()] = fields.size()-1;
    }
}

/*
 * the sigil consists of two hidden fields:
 *   <name>_time  sha1 of the unix time of this instance
 *   <name>       placeholder, overwritten by the browser with the proof
 * the placeholder is longer than a proof, so it never validates.
 */
bool GhostField::set_sigil(const string name)
{
    if (!sigilname.empty()) {
        return true;
    }
    if (!valid_name(name)) {
        syslog(LOG_DEBUG, "invalid sigil name, javascript check stays disabled.");
        return false;
    }

    struct timeval tv;
    gettimeofday(&tv, NULL);
    char token[32];
    snprintf(token, sizeof(token), "%08lx%05lx", static_cast<unsigned long>(tv.tv_sec),
             static_cast<unsigned long>(tv.tv_usec));

    sigilname = name;
    sigiltime = sha1_hex(lexical_cast<string>(static_cast<long long>(now)));
    make_field(false, sigilname + "_time", "hidden", "", sigiltime, true);
    make_field(false, sigilname, "hidden", "", GF_PROOF_PREFIX + token, true);
    return true;
}

bool GhostField::sigil_enabled() const
{
    return !sigilname.empty();
}

string GhostField::get_sigil_name() const
{
    return sigilname;
}

GhostField &GhostField::create_fields(const vector<GfFieldSpec> &specs)
{
    BOOST_FOREACH(const GfFieldSpec &spec, specs) {
        create_field(spec.legit, spec.name, spec.type, spec.placeholder);
    }
    return *this;
}

boost::optional<GfField> GhostField::create_field(const bool legit, const string name, const string type,
                                                  const string placeholder)
{
    return make_field(legit, name, type, placeholder, "", false);
}

GhostField &GhostField::add_legit(const string name, const string type, const string placeholder)
{
    create_field(true, name, type, placeholder);
    return *this;
}

GhostField &GhostField::add_honeypot(const string name, const string type, const string placeholder)
{
    create_field(false, name, type, placeholder);
    return *this;
}

const vector<GfField> &GhostField::get_fields() const
{
    return fields;
}

boost::optional<GfField> GhostField::get_field(const string &name) const
{
    map<string, size_t>::const_iterator it = byname.find(name);
    if (it == byname.end()) {
        return boost::none;
    }
    return fields[it->second];
}

/*
 * only ids of the current hour are indexed, older ones are recomputed
 * when a submission is checked
 */
boost::optional<GfField> GhostField::get_field_by_id(const string &id) const
{
    map<string, size_t>::const_iterator it = byid.find(id);
    if (it == byid.end()) {
        return boost::none;
    }
    return fields[it->second];
}

string GhostField::get_id(const string &name) const
{
    boost::optional<GfField> field = get_field(name);
    if (field) {
        return field->getid();
    }
    return "";
}

time_t GhostField::get_now() const
{
    return now;
}

string GhostField::get_timestamp() const
{
    return timestamp;
}

/*
 * current hour, and the previous hour if it formats differently
 * (it does not when the clock is turned back at the end of DST)
 */
vector<string> GhostField::get_timestamps() const
{
    vector<string> timestamps;
    timestamps.push_back(timestamp);
    string previous = time_bucket(now - 3600, utc);
    if (previous != timestamp) {
        timestamps.push_back(previous);
    }
    return timestamps;
}

string GhostField::expected_proof(const string &useragent, const string &timevalue) const
{
    return sigil_proof(useragent, timevalue);
}

/*
 * filter the legit data from a submission, all fields are looked up with the
 * current ids, and only if none is found with the ids of the previous hour
 */
map<string, string> GhostField::get_data(const FormData &input) const
{
    map<string, string> data;
    vector<string> timestamps = get_timestamps();

    BOOST_FOREACH(const string &ts, timestamps) {
        BOOST_FOREACH(const GfField &field, fields) {
            if (!field.islegit()) {
                continue;
            }
            FormData::const_iterator it = input.find(random_name(field.getname(), ts));
            if (it != input.end()) {
                data[field.getname()] = it->second;
            }
        }
        if (!data.empty()) {
            break;
        }
    }
    return data;
}

/*
 * check a submission
 *  1. every honeypot of every accepted hour must be empty or missing
 *  2. if the sigil is enabled, time and proof must be present and the proof
 *     must be the one the browser computes from user agent and time
 * an empty value is no fill-in, whitespace is.
 */
bool GhostField::validate(const FormData &data, const string &useragent) const
{
    string insigiltime, insigilproof;
    vector<string> timestamps = get_timestamps();

    BOOST_FOREACH(const string &ts, timestamps) {
        BOOST_FOREACH(const GfField &field, fields) {
            if (field.islegit()) {
                continue;
            }
            FormData::const_iterator it = data.find(random_name(field.getname(), ts));
            if (field.issigil()) {
                // first value found wins, later hours do not overwrite it
                if (it != data.end()) {
                    if (field.getname() == sigilname + "_time" && insigiltime.empty()) {
                        insigiltime = it->second;
                    } else if (field.getname() == sigilname && insigilproof.empty()) {
                        insigilproof = it->second;
                    }
                }
                continue;
            }
            if (it != data.end() && !it->second.empty()) {
                syslog(LOG_NOTICE, "rejected submission, honeypot <%s> filled.", field.getname().c_str());
                return false;
            }
        }
    }

    if (sigil_enabled()) {
        if (insigiltime.empty() || insigilproof.empty()) {
            syslog(LOG_NOTICE, "rejected submission, sigil <%s> missing.", sigilname.c_str());
            return false;
        }
        if (expected_proof(useragent, insigiltime) != insigilproof) {
            syslog(LOG_NOTICE, "rejected submission, sigil <%s> does not match.", sigilname.c_str());
            return false;
        }
    }

    return true;
}
