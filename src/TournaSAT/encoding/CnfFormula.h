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

#ifndef TOURNASAT_CNFFORMULA_H
#define TOURNASAT_CNFFORMULA_H

#include <utility>
#include <vector>

namespace TournaSAT {
	// disjunction of non-zero literals, negative literal = negated variable
	typedef std::vector<int> Clause;

	/*!
	 * \brief CnfFormula conjunction of clauses over the variables 1..numVariables
	 */
	struct CnfFormula {
		int numVariables;
		std::vector<Clause> clauses;

		CnfFormula() : numVariables(0) {}
		CnfFormula(int numVariables, std::vector<Clause> clauses)
			: numVariables(numVariables), clauses(std::move(clauses)) {}

		/*!
		 * append all clauses of the given family
		 * @param family clauses produced by one constraint family
		 */
		void append(std::vector<Clause> &&family) {
			this->clauses.reserve(this->clauses.size() + family.size());
			for (auto &c : family) this->clauses.emplace_back(std::move(c));
			family.clear();
		}
	};
}

#endif //TOURNASAT_CNFFORMULA_H
