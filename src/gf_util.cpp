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
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <time.h>
#include <stdint.h>

// openssl
#include <openssl/evp.h>

// boost
#include <boost/algorithm/string.hpp>
#include <boost/foreach.hpp>
#include <boost/lexical_cast.hpp>

#include "gf_util.h"

using boost::lexical_cast;

using namespace std;


/*
 * format the hour of t, this is the time bucket used in the wire ids
 */
string time_bucket(const time_t t, const bool utc)
{
    struct tm tmv;
    struct tm *res;
    char buf[32];

    if (utc) {
        res = gmtime_r(&t, &tmv);
    } else {
        res = localtime_r(&t, &tmv);
    }
    if (res == NULL) {
        throw runtime_error("time out of range: " + lexical_cast<string>(static_cast<long long>(t)));
    }
    if (strftime(buf, sizeof(buf), "%Y-%m-%d %H", &tmv) == 0) {
        throw runtime_error("can not format hour of " + lexical_cast<string>(static_cast<long long>(t)));
    }
    return string(buf);
}

string derive_wire_id(const string &name, const string &key, const string &bucket)
{
    return GF_ID_PREFIX + sha512_hex(name + "_" + key + bucket);
}

static string hex_encode(const unsigned char *data, const size_t len)
{
    ostringstream o;
    o << hex << setfill('0');
    for (size_t i=0; i<len; i++) {
        o << setw(2) << static_cast<int>(data[i]);
    }
    return o.str();
}

/*
 * one-shot digest with the openssl EVP interface
 */
static string digest_hex(const EVP_MD *md, const string &data)
{
    unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX *)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), md, NULL) != 1) {
        throw runtime_error("EVP_DigestInit_ex failed");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw runtime_error("EVP_DigestUpdate failed");
    }
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outlen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &outlen) != 1) {
        throw runtime_error("EVP_DigestFinal_ex failed");
    }
    return hex_encode(out, outlen);
}

string sha512_hex(const string &data)
{
    return digest_hex(EVP_sha512(), data);
}

string sha1_hex(const string &data)
{
    return digest_hex(EVP_sha1(), data);
}

string fnv1a32(const string &data)
{
    uint32_t hash = 0x811c9dc5u;
    BOOST_FOREACH(const char c, data) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 0x01000193u;
    }
    char buf[9];
    snprintf(buf, sizeof(buf), "%08x", hash);
    return string(buf);
}

string sigil_proof(const string &useragent, const string &timevalue)
{
    return GF_PROOF_PREFIX + fnv1a32(useragent + timevalue);
}

static int hexdigit(const char c)
{
    if (c>='0' && c<='9') return c - '0';
    if (c>='a' && c<='f') return c - 'a' + 10;
    if (c>='A' && c<='F') return c - 'A' + 10;
    return -1;
}

/*
 * decode '+' and %XX, broken escapes are kept as they are
 */
string url_decode(const string &in)
{
    string out;
    out.reserve(in.size());
    for (size_t i=0; i<in.size(); i++) {
        if (in[i] == '+') {
            out += ' ';
        } else if (in[i] == '%' && i+2 < in.size()
                   && hexdigit(in[i+1]) >= 0 && hexdigit(in[i+2]) >= 0) {
            out += static_cast<char>(hexdigit(in[i+1])*16 + hexdigit(in[i+2]));
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

/*
 * split a form body into its key/value pairs, a repeated key overwrites
 * the earlier value, a key without '=' gets an empty value
 */
FormData parse_urlencoded(const string &body)
{
    FormData data;
    vector<string> pairs;
    string trimmed = boost::trim_right_copy_if(body, boost::is_any_of("\r\n"));

    boost::split(pairs, trimmed, boost::is_any_of("&"));
    BOOST_FOREACH(const string &pair, pairs) {
        if (pair.empty()) continue;
        string::size_type eq = pair.find('=');
        if (eq == string::npos) {
            data[url_decode(pair)] = "";
        } else {
            data[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq+1));
        }
    }
    return data;
}
