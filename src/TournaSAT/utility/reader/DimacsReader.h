/*
    This file is part of the TournaSAT project.

    Copyright (C) 2024

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef TOURNASAT_DIMACSREADER_H
#define TOURNASAT_DIMACSREADER_H

#include <TournaSAT/encoding/CnfFormula.h>
#include <istream>
#include <string>

namespace TournaSAT {
	/*!
	 * \brief DimacsReader reads a formula in DIMACS CNF format
	 *
	 * throws ParseError for a missing or malformed problem line, literals outside of the declared variable range,
	 * a clause count that does not match the problem line, or an unterminated last clause
	 */
	class DimacsReader {
	public:
		/*!
		 * read file
		 * @param filepath
		 * @return the formula
		 */
		static CnfFormula read(const std::string &filepath);
		static CnfFormula read(std::istream &stream);
		/*!
		 * only parse the problem line
		 * @param filepath
		 * @return number of variables declared in the file
		 */
		static int readNumVariables(const std::string &filepath);
	};
}

#endif //TOURNASAT_DIMACSREADER_H
