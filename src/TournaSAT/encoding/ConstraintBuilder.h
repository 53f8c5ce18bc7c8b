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

#ifndef TOURNASAT_CONSTRAINTBUILDER_H
#define TOURNASAT_CONSTRAINTBUILDER_H

#include <TournaSAT/encoding/CnfFormula.h>
#include <TournaSAT/encoding/LiteralCounter.h>
#include <TournaSAT/encoding/VariableIndexer.h>
#include <vector>

namespace TournaSAT {

	/*!
	 * \brief ConstraintBuilder creates the clauses of the round-robin tournament problem
	 *
	 * Every constraint family is returned as a separate clause container, build() merges them into one formula.
	 */
	class ConstraintBuilder {
	public:
		/*!
		 * max. number of matches of one team in the same period over the whole tournament
		 */
		static const int MAX_MATCHES_PER_PERIOD = 2;

		explicit ConstraintBuilder(const VariableIndexer &indexer);

		/*!
		 * every team plays exactly once per week
		 */
		std::vector<Clause> teamPlaysOncePerWeek();
		/*!
		 * every pair of teams meets exactly once
		 */
		std::vector<Clause> pairMeetsOnce();
		/*!
		 * at most one match per week and period
		 */
		std::vector<Clause> oneMatchPerSlot();
		/*!
		 * every team plays at most MAX_MATCHES_PER_PERIOD times in the same period
		 * @param counter source of the counter registers
		 */
		std::vector<Clause> periodLimit(LiteralCounter &counter);
		/*!
		 * every week contains at least one match (redundant w.r.t. the other families)
		 */
		std::vector<Clause> weekHasMatch();

		/*!
		 * create all constraint families
		 * @return the complete formula
		 */
		CnfFormula build();

		void setQuiet(bool q) { this->quiet = q; }

		int getTeamWeekClauseCounter() const { return this->teamWeekClauseCounter; }
		int getPairClauseCounter() const { return this->pairClauseCounter; }
		int getSlotClauseCounter() const { return this->slotClauseCounter; }
		int getPeriodLimitClauseCounter() const { return this->periodLimitClauseCounter; }
		int getWeekClauseCounter() const { return this->weekClauseCounter; }
		int getAuxiliaryLiteralCounter() const { return this->auxiliaryLiteralCounter; }

	private:
		/*!
		 * pairwise at-most-one over vars
		 * @param vars
		 * @param clauses container the clauses are appended to
		 */
		static void addAtMostOne(const std::vector<int> &vars, std::vector<Clause> &clauses);

		const VariableIndexer &indexer;
		bool quiet;
		int teamWeekClauseCounter;
		int pairClauseCounter;
		int slotClauseCounter;
		int periodLimitClauseCounter;
		int weekClauseCounter;
		int auxiliaryLiteralCounter;
	};
}

#endif //TOURNASAT_CONSTRAINTBUILDER_H
