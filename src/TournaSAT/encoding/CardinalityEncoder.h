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

#ifndef TOURNASAT_CARDINALITYENCODER_H
#define TOURNASAT_CARDINALITYENCODER_H

#include <TournaSAT/encoding/CnfFormula.h>
#include <TournaSAT/encoding/LiteralCounter.h>
#include <vector>

namespace TournaSAT {

	/*!
	 * \brief CardinalityEncoding clauses and auxiliary variables of one "at most k" constraint
	 */
	struct CardinalityEncoding {
		std::vector<Clause> clauses;
		std::vector<int> auxiliaryVariables;
	};

	/*!
	 * \brief CardinalityEncoder sequential counter encoding of "at most k of the given literals are true"
	 *
	 * C. Sinz, 'Towards an Optimal CNF Encoding of Boolean Cardinality Constraints', CP 2005.
	 *
	 * Register s[i][j] (1 <= i < m, 1 <= j <= k) is forced to true whenever at least j of the first i literals
	 * are true. A literal that would push the count of its predecessors beyond k is forbidden.
	 * Uses (m-1)*k auxiliary variables and O(m*k) clauses.
	 */
	class CardinalityEncoder {
	public:
		/*!
		 * @param literals the literals to count (order defines the counter chain)
		 * @param bound k, must be >= 0
		 * @param counter source of fresh ids for the registers
		 * @return clauses and registers, empty if the constraint is trivially satisfied (k >= m)
		 */
		static CardinalityEncoding atMost(const std::vector<int> &literals, int bound, LiteralCounter &counter);
	};
}

#endif //TOURNASAT_CARDINALITYENCODER_H
