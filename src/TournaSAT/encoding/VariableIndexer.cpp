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

#include "VariableIndexer.h"
#include <TournaSAT/utility/Exception.h>
#include <initializer_list>
#include <limits>
#include <string>

namespace TournaSAT {

	VariableIndexer::VariableIndexer(int numTeams) : numTeams(numTeams), numWeeks(numTeams - 1),
		numPeriods(numTeams / 2), numFacts(0) {
		checkNumTeams(numTeams);
		this->pairIndices.assign((unsigned int)numTeams + 1, std::vector<int>((unsigned int)numTeams + 1, -1));
		for (int a = 1; a <= numTeams; a++) {
			for (int b = a + 1; b <= numTeams; b++) {
				this->pairIndices[a][b] = (int)this->pairs.size();
				this->pairs.emplace_back(a, b);
			}
		}
		this->numFacts = (int)((long long)this->pairs.size() * this->numWeeks * this->numPeriods * 2);
	}

	void VariableIndexer::checkNumTeams(int numTeams) {
		if (numTeams < 4) {
			throw InvalidInputError("Number of teams must be at least 4 (got " + std::to_string(numTeams) + ")");
		}
		if (numTeams % 2 != 0) {
			throw InvalidInputError("Number of teams must be even (got " + std::to_string(numTeams) + ")");
		}
		// pairs * weeks * periods * slots must fit into the DIMACS variable range, checked factor by factor
		const long long maxVariable = std::numeric_limits<int>::max();
		long long facts = (long long)numTeams * (numTeams - 1) / 2;
		for (long long factor : {(long long)numTeams - 1, (long long)numTeams / 2, 2LL}) {
			if (facts > maxVariable) break;
			facts *= factor;
		}
		if (facts > maxVariable) {
			throw InvalidInputError("VariableIndexer: " + std::to_string(numTeams) + " teams exceed the variable range");
		}
	}

	int VariableIndexer::getPairIndex(int teamA, int teamB) const {
		if (teamA < 1 or teamB > this->numTeams or teamA >= teamB) {
			throw EncodingError("VariableIndexer: invalid team pair (" + std::to_string(teamA) + ", " +
				std::to_string(teamB) + ")");
		}
		return this->pairIndices[teamA][teamB];
	}

	int VariableIndexer::getVariable(const Fact &f) const {
		return this->getVariable(f.teamA, f.teamB, f.week, f.period, f.slot);
	}

	int VariableIndexer::getVariable(int teamA, int teamB, int week, int period, Slot slot) const {
		auto pairIndex = this->getPairIndex(teamA, teamB);
		if (week < 1 or week > this->numWeeks) {
			throw EncodingError("VariableIndexer: week " + std::to_string(week) + " out of range");
		}
		if (period < 1 or period > this->numPeriods) {
			throw EncodingError("VariableIndexer: period " + std::to_string(period) + " out of range");
		}
		if (slot != HOME and slot != AWAY) {
			throw EncodingError("VariableIndexer: invalid slot " + std::to_string((int)slot));
		}
		return (((pairIndex * this->numWeeks) + week - 1) * this->numPeriods + period - 1) * 2 + (int)slot + 1;
	}

	Fact VariableIndexer::getFact(int id) const {
		if (!this->isPrimary(id)) {
			throw EncodingError("VariableIndexer: variable " + std::to_string(id) + " does not belong to a fact");
		}
		int rest = id - 1;
		auto slot = (Slot)(rest % 2);
		rest /= 2;
		int period = rest % this->numPeriods + 1;
		rest /= this->numPeriods;
		int week = rest % this->numWeeks + 1;
		rest /= this->numWeeks;
		auto &p = this->pairs.at((unsigned int)rest);
		return Fact(p.first, p.second, week, period, slot);
	}

	std::vector<int> VariableIndexer::getTeamWeekVariables(int team, int week) const {
		std::vector<int> vars;
		for (int other = 1; other <= this->numTeams; other++) {
			if (other == team) continue;
			auto a = team < other ? team : other;
			auto b = team < other ? other : team;
			for (int p = 1; p <= this->numPeriods; p++) {
				vars.emplace_back(this->getVariable(a, b, week, p, HOME));
				vars.emplace_back(this->getVariable(a, b, week, p, AWAY));
			}
		}
		return vars;
	}

	std::vector<int> VariableIndexer::getPairVariables(int team1, int team2) const {
		auto a = team1 < team2 ? team1 : team2;
		auto b = team1 < team2 ? team2 : team1;
		std::vector<int> vars;
		for (int w = 1; w <= this->numWeeks; w++) {
			for (int p = 1; p <= this->numPeriods; p++) {
				vars.emplace_back(this->getVariable(a, b, w, p, HOME));
				vars.emplace_back(this->getVariable(a, b, w, p, AWAY));
			}
		}
		return vars;
	}

	std::vector<int> VariableIndexer::getSlotVariables(int week, int period) const {
		std::vector<int> vars;
		for (auto &p : this->pairs) {
			vars.emplace_back(this->getVariable(p.first, p.second, week, period, HOME));
			vars.emplace_back(this->getVariable(p.first, p.second, week, period, AWAY));
		}
		return vars;
	}

	std::vector<int> VariableIndexer::getTeamPeriodVariables(int team, int period) const {
		std::vector<int> vars;
		for (int w = 1; w <= this->numWeeks; w++) {
			for (int other = 1; other <= this->numTeams; other++) {
				if (other == team) continue;
				auto a = team < other ? team : other;
				auto b = team < other ? other : team;
				vars.emplace_back(this->getVariable(a, b, w, period, HOME));
				vars.emplace_back(this->getVariable(a, b, w, period, AWAY));
			}
		}
		return vars;
	}
}
