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

#include "Schedule.h"
#include <TournaSAT/utility/Exception.h>
#include <algorithm>
#include <string>

namespace TournaSAT {

	Schedule::Schedule(int numTeams, const std::vector<Fact> &facts) : numTeams(numTeams), facts(facts) {
		if (numTeams < 2) {
			throw InvariantViolation("Schedule: invalid number of teams " + std::to_string(numTeams));
		}
		this->grid.assign((unsigned int)this->getNumWeeks(), std::vector<Match>((unsigned int)this->getNumPeriods()));
		for (auto &f : facts) {
			if (f.week < 1 or f.week > this->getNumWeeks() or f.period < 1 or f.period > this->getNumPeriods()) {
				throw InvariantViolation("Schedule: match out of range (" + f.toString() + ")");
			}
			if (f.teamA < 1 or f.teamB > numTeams or f.teamA >= f.teamB) {
				throw InvariantViolation("Schedule: invalid teams (" + f.toString() + ")");
			}
			auto &m = this->grid[f.week - 1][f.period - 1];
			if (!m.isEmpty()) {
				throw InvariantViolation("Schedule: week " + std::to_string(f.week) + " period " +
					std::to_string(f.period) + " hosts more than one match");
			}
			m = Match(f.getHomeTeam(), f.getAwayTeam());
		}
		std::sort(this->facts.begin(), this->facts.end(), [](const Fact &f1, const Fact &f2) {
			if (f1.week != f2.week) return f1.week < f2.week;
			return f1.period < f2.period;
		});
	}

	const Match &Schedule::getMatch(int week, int period) const {
		if (week < 1 or week > this->getNumWeeks() or period < 1 or period > this->getNumPeriods()) {
			throw Exception("Schedule::getMatch: week " + std::to_string(week) + " period " + std::to_string(period) +
				" out of range");
		}
		return this->grid[week - 1][period - 1];
	}
}
