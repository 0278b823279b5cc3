#ifndef GFFIELD_H
#define GFFIELD_H

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


using namespace std;

/*
 * GfField class
 * represents one input of a form, either a legit data field or a honeypot.
 *
 * a field is built once by the registry and not changed afterwards, the
 * wire id is what the browser sees as input name.
 *
 */


class GfField {

private:
    string name;
    string id;
    string type;
    string placeholder;
    string value;
    bool legit;
    bool sigil;

public:
    // an empty type becomes "text"
    GfField(const string name, const string id, const bool legit, const string type = "",
            const string placeholder = "", const string value = "", const bool sigil = false);

    string getname() const {
        return name;
    }

    string getid() const {
        return id;
    }

    string gettype() const {
        return type;
    }

    string getplaceholder() const {
        return placeholder;
    }

    string getvalue() const {
        return value;
    }

    bool islegit() const {
        return legit;
    }

    // sigil fields belong to the javascript handshake
    bool issigil() const {
        return sigil;
    }

    bool ishidden() const {
        return type == "hidden";
    }
};

#endif
