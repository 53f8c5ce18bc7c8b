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

#ifndef TOURNASAT_SCHEDULE_H
#define TOURNASAT_SCHEDULE_H

#include <TournaSAT/encoding/Fact.h>
#include <vector>

namespace TournaSAT {

	/*!
	 * \brief Match one entry of the week x period grid
	 */
	struct Match {
		int home;
		int away;

		Match() : home(0), away(0) {}
		Match(int home, int away) : home(home), away(away) {}
		bool isEmpty() const { return this->home == 0; }
	};

	/*!
	 * \brief Schedule maps (week, period) to the match played there
	 *
	 * Immutable after construction.
	 */
	class Schedule {
	public:
		/*!
		 * throws InvariantViolation if a fact is out of range or two facts occupy the same week and period
		 * @param numTeams number of teams
		 * @param facts the matches
		 */
		Schedule(int numTeams, const std::vector<Fact> &facts);

		int getNumTeams() const { return this->numTeams; }
		int getNumWeeks() const { return this->numTeams - 1; }
		int getNumPeriods() const { return this->numTeams / 2; }
		/*!
		 * @param week 1-based
		 * @param period 1-based
		 * @return the match, empty if nothing was scheduled there
		 */
		const Match &getMatch(int week, int period) const;
		/*!
		 * @return all matches as facts, ordered by week and period
		 */
		const std::vector<Fact> &getFacts() const { return this->facts; }

	private:
		int numTeams;
		std::vector<std::vector<Match>> grid;
		std::vector<Fact> facts;
	};
}

#endif //TOURNASAT_SCHEDULE_H
