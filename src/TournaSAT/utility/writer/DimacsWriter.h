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

#ifndef TOURNASAT_DIMACSWRITER_H
#define TOURNASAT_DIMACSWRITER_H

#include <TournaSAT/utility/writer/Writer.h>
#include <TournaSAT/encoding/CnfFormula.h>
#include <ostream>

namespace TournaSAT {
	/*!
	 * \brief DimacsWriter writes a formula in DIMACS CNF format
	 *
	 *   p cnf <#variables> <#clauses>
	 *   <lit> <lit> ... 0
	 */
	class DimacsWriter : public Writer {
	public:
		DimacsWriter(std::string path, const CnfFormula &formula);
		/*!
		 * write the formula to the path given in the constructor
		 */
		void write() override;
		/*!
		 * write a formula to an arbitrary stream
		 * @param formula
		 * @param stream
		 */
		static void write(const CnfFormula &formula, std::ostream &stream);
	private:
		const CnfFormula &formula;
	};
}

#endif //TOURNASAT_DIMACSWRITER_H
