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

#ifndef TOURNASAT_VARIABLEINDEXER_H
#define TOURNASAT_VARIABLEINDEXER_H

#include <TournaSAT/encoding/Fact.h>
#include <utility>
#include <vector>

namespace TournaSAT {

	/*!
	 * \brief VariableIndexer bijection between facts and the primary SAT variables
	 *
	 * Ids are dense and start at 1. The numbering only depends on the number of teams:
	 *   id = ((((pairIndex * weeks) + week-1) * periods + period-1) * 2 + slot) + 1
	 * where pairIndex enumerates the pairs (a,b) with a < b lexicographically.
	 */
	class VariableIndexer {
	public:
		/*!
		 * throws InvalidInputError if numTeams is odd or smaller than 4
		 * @param numTeams number of teams in the tournament
		 */
		explicit VariableIndexer(int numTeams);

		/*!
		 * throws InvalidInputError if the number of teams can not be scheduled
		 * @param numTeams
		 */
		static void checkNumTeams(int numTeams);

		int getNumTeams() const { return this->numTeams; }
		int getNumWeeks() const { return this->numWeeks; }
		int getNumPeriods() const { return this->numPeriods; }
		int getNumPairs() const { return (int)this->pairs.size(); }
		/*!
		 * @return number of primary variables (= largest primary id)
		 */
		int getNumFacts() const { return this->numFacts; }

		/*!
		 * throws EncodingError for facts outside of the domain (a >= b or values out of range)
		 * @return id of the fact
		 */
		int getVariable(const Fact &f) const;
		int getVariable(int teamA, int teamB, int week, int period, Slot slot) const;
		/*!
		 * throws EncodingError for ids that are not primary variables
		 * @param id variable id
		 * @return the fact that belongs to this id
		 */
		Fact getFact(int id) const;
		/*!
		 * @return true if the id belongs to a fact (auxiliary variables return false)
		 */
		bool isPrimary(int id) const { return id >= 1 and id <= this->numFacts; }

		/*!
		 * all facts in which the team plays in the given week (all opponents, periods and slots)
		 */
		std::vector<int> getTeamWeekVariables(int team, int week) const;
		/*!
		 * all facts in which team1 meets team2 (order of the arguments does not matter)
		 */
		std::vector<int> getPairVariables(int team1, int team2) const;
		/*!
		 * all facts that occupy the given week and period
		 */
		std::vector<int> getSlotVariables(int week, int period) const;
		/*!
		 * all facts in which the team plays in the given period (all weeks, opponents and slots)
		 */
		std::vector<int> getTeamPeriodVariables(int team, int period) const;

	private:
		int getPairIndex(int teamA, int teamB) const;

		int numTeams;
		int numWeeks;
		int numPeriods;
		int numFacts;
		std::vector<std::pair<int, int>> pairs;
		// pairIndices[a][b] for a < b, -1 otherwise
		std::vector<std::vector<int>> pairIndices;
	};
}

#endif //TOURNASAT_VARIABLEINDEXER_H
