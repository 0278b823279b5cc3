#ifndef GF_UTIL_H
#define GF_UTIL_H

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

#include <ctime>
#include <map>
#include <string>

using namespace std;

// decoded form submission, wire id -> submitted value
typedef map<string, string> FormData;

// prefix of the javascript proof, part of the wire contract with the browser
const string GF_PROOF_PREFIX = "tck_";

// prefix of every wire id, makes sure the id starts with a letter
const string GF_ID_PREFIX = "ID";

// hour bucket "YYYY-MM-DD HH" of t, in local time or UTC
// throws runtime_error if t is outside the range of the calendar
string time_bucket(const time_t t, const bool utc);

/*
 * obfuscated name of a field, "ID" + sha512(name + "_" + key + bucket)
 * an empty key still gives a stable result, but anybody can compute it.
 */
string derive_wire_id(const string &name, const string &key, const string &bucket);

// lowercase hex digests, throw runtime_error if openssl fails
string sha512_hex(const string &data);
string sha1_hex(const string &data);

/*
 * 32 bit FNV-1a over the bytes of data, 8 lowercase hex digits.
 * the browser side hashes the UTF-8 encoding of the same string, so
 * data has to be passed as UTF-8.
 */
string fnv1a32(const string &data);

// the value the browser has to put into the sigil field
string sigil_proof(const string &useragent, const string &timevalue);

// application/x-www-form-urlencoded decoding
string url_decode(const string &in);
FormData parse_urlencoded(const string &body);

#endif
