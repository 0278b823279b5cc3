#ifndef GF_MARKUP_H
#define GF_MARKUP_H

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

#include "ghostfield.h"

using namespace std;

string html_escape(const string &in);

// trap inputs of all honeypot and sigil fields, to be placed inside the form
string render_honeypots(const GhostField &gf);

/*
 * script hiding the trap inputs and removing their required flag,
 * with the sigil enabled it also writes the proof into the sigil field
 */
string render_hide_js(const GhostField &gf);

#endif
