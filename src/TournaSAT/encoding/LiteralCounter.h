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

#ifndef TOURNASAT_LITERALCOUNTER_H
#define TOURNASAT_LITERALCOUNTER_H

namespace TournaSAT {
	/*!
	 * \brief LiteralCounter hands out fresh variable ids
	 *
	 * One counter is owned by every solve attempt. It starts behind the primary fact variables and
	 * only grows.
	 */
	class LiteralCounter {
	public:
		/*!
		 * @param maxUsedVariable largest id that is already taken (0 for an empty formula)
		 */
		explicit LiteralCounter(int maxUsedVariable = 0);
		/*!
		 * @return a variable id that was never returned before
		 */
		int getFreshVariable();
		/*!
		 * @return largest id handed out so far (= number of variables of the formula)
		 */
		int getMaxVariable() const { return this->maxVariable; }
	private:
		int maxVariable;
	};
}

#endif //TOURNASAT_LITERALCOUNTER_H
