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

#include <sstream>
#include <string>

// BOOST
#include <boost/foreach.hpp>

#include "gf_markup.h"

using namespace std;


string html_escape(const string &in)
{
    string out;
    out.reserve(in.size());
    BOOST_FOREACH(const char c, in) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#039;"; break;
            default:   out += c;
        }
    }
    return out;
}

/*
 * visible honeypots get a label carrying the wire id, the script hides the
 * label by that id. hidden fields (the sigil) are plain hidden inputs.
 */
string render_honeypots(const GhostField &gf)
{
    ostringstream html;

    BOOST_FOREACH(const GfField &field, gf.get_fields()) {
        if (field.islegit()) {
            continue;
        }
        if (field.ishidden()) {
            html << "<input type=\"hidden\" name=\"" << field.getid()
                 << "\" value=\"" << html_escape(field.getvalue()) << "\" />\n";
            continue;
        }
        html << "<label id=\"" << field.getid() << "\">\n"
             << "    " << html_escape(field.getname()) << "\n"
             << "    <input type=\"" << html_escape(field.gettype())
             << "\" name=\"" << field.getid()
             << "\" title=\"" << html_escape(field.getplaceholder())
             << "\" placeholder=\"" << html_escape(field.getplaceholder())
             << "\" value=\"" << html_escape(field.getvalue())
             << "\" autocomplete=\"off\" required tabindex=\"-1\" />"
             << "</label>\n";
    }
    return html.str();
}

/*
 * the fnv1a32 in the script must give the same result as fnv1a32() in
 * gf_util.cpp, so it hashes the UTF-8 bytes from TextEncoder and not the
 * UTF-16 code units of the string
 */
string render_hide_js(const GhostField &gf)
{
    ostringstream js;

    js << "(function() {\n"
       << "    function fnv1a32(str) {\n"
       << "        let hash = 0x811c9dc5;\n"
       << "        const bytes = (new TextEncoder()).encode(str);\n"
       << "        for (let i = 0; i < bytes.length; i++) {\n"
       << "            hash ^= bytes[i];\n"
       << "            hash = Math.imul(hash, 0x01000193);\n"
       << "        }\n"
       << "        return (hash >>> 0).toString(16).padStart(8, '0');\n"
       << "    }\n"
       << "    let label = null;\n"
       << "    let input = null;\n"
       << "    const style = document.createElement('style');\n"
       << "    style.type = 'text/css';\n";

    BOOST_FOREACH(const GfField &field, gf.get_fields()) {
        if (field.islegit()) {
            continue;
        }
        js << "    style.innerHTML += '#" << field.getid() << " {"
           << " pointer-events: none; position: absolute; display: block; opacity: 0;"
           << " left: -9999px; max-width: 0; width: 0; height: 0; max-height: 0; }';\n"
           << "    label = document.getElementById('" << field.getid() << "');\n"
           << "    input = label ? label.querySelector('input') : null;\n"
           << "    if (input) {\n"
           << "        input.required = false;\n"
           << "        input.removeAttribute('required');\n"
           << "    }\n";
        if (field.issigil() && field.getname() == gf.get_sigil_name()) {
            js << "    {\n"
               << "        const T = document.querySelector('input[name=\""
               << gf.get_id(gf.get_sigil_name() + "_time") << "\"]');\n"
               << "        const S = document.querySelector('input[name=\"" << field.getid() << "\"]');\n"
               << "        if (T && S) {\n"
               << "            S.value = '" << GF_PROOF_PREFIX << "' + fnv1a32(navigator.userAgent + T.value);\n"
               << "        }\n"
               << "    }\n";
        }
    }

    js << "    document.head.appendChild(style);\n"
       << "})();\n";
    return js.str();
}
