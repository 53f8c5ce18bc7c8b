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

#ifndef TOURNASAT_FACT_H
#define TOURNASAT_FACT_H

#include <string>

namespace TournaSAT {

	/*!
	 * orientation of a match
	 * HOME: the lower numbered team plays at home
	 * AWAY: the higher numbered team plays at home
	 */
	enum Slot {
		HOME = 0,
		AWAY = 1
	};

	/*!
	 * \brief Fact the statement "teamA meets teamB in the given week and period"
	 *
	 * Facts are canonical: teamA < teamB always holds and the slot carries the home/away orientation.
	 * Teams, weeks and periods are 1-based.
	 */
	struct Fact {
		int teamA;
		int teamB;
		int week;
		int period;
		Slot slot;

		Fact() : teamA(0), teamB(0), week(0), period(0), slot(HOME) {}
		Fact(int teamA, int teamB, int week, int period, Slot slot)
			: teamA(teamA), teamB(teamB), week(week), period(period), slot(slot) {}

		int getHomeTeam() const { return this->slot == HOME ? this->teamA : this->teamB; }
		int getAwayTeam() const { return this->slot == HOME ? this->teamB : this->teamA; }
		bool involves(int team) const { return this->teamA == team or this->teamB == team; }

		bool operator==(const Fact &other) const {
			return this->teamA == other.teamA and this->teamB == other.teamB and this->week == other.week
				and this->period == other.period and this->slot == other.slot;
		}
		bool operator!=(const Fact &other) const { return !(*this == other); }

		std::string toString() const;
	};
}

#endif //TOURNASAT_FACT_H
