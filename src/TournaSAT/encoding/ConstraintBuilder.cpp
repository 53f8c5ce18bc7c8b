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

#include "ConstraintBuilder.h"
#include <TournaSAT/encoding/CardinalityEncoder.h>
#include <TournaSAT/utility/Exception.h>
#include <iostream>
#include <string>

namespace TournaSAT {

	const int ConstraintBuilder::MAX_MATCHES_PER_PERIOD;

	ConstraintBuilder::ConstraintBuilder(const VariableIndexer &indexer) : indexer(indexer), quiet(true),
		teamWeekClauseCounter(0), pairClauseCounter(0), slotClauseCounter(0), periodLimitClauseCounter(0),
		weekClauseCounter(0), auxiliaryLiteralCounter(0) {
	}

	void ConstraintBuilder::addAtMostOne(const std::vector<int> &vars, std::vector<Clause> &clauses) {
		for (size_t i = 0; i < vars.size(); i++) {
			for (size_t j = i + 1; j < vars.size(); j++) {
				clauses.push_back({-vars[i], -vars[j]});
			}
		}
	}

	std::vector<Clause> ConstraintBuilder::teamPlaysOncePerWeek() {
		std::vector<Clause> clauses;
		for (int t = 1; t <= this->indexer.getNumTeams(); t++) {
			for (int w = 1; w <= this->indexer.getNumWeeks(); w++) {
				auto vars = this->indexer.getTeamWeekVariables(t, w);
				// at least one
				clauses.emplace_back(vars);
				addAtMostOne(vars, clauses);
			}
		}
		this->teamWeekClauseCounter = (int)clauses.size();
		return clauses;
	}

	std::vector<Clause> ConstraintBuilder::pairMeetsOnce() {
		std::vector<Clause> clauses;
		for (int a = 1; a <= this->indexer.getNumTeams(); a++) {
			for (int b = a + 1; b <= this->indexer.getNumTeams(); b++) {
				auto vars = this->indexer.getPairVariables(a, b);
				clauses.emplace_back(vars);
				addAtMostOne(vars, clauses);
			}
		}
		this->pairClauseCounter = (int)clauses.size();
		return clauses;
	}

	std::vector<Clause> ConstraintBuilder::oneMatchPerSlot() {
		std::vector<Clause> clauses;
		for (int w = 1; w <= this->indexer.getNumWeeks(); w++) {
			for (int p = 1; p <= this->indexer.getNumPeriods(); p++) {
				addAtMostOne(this->indexer.getSlotVariables(w, p), clauses);
			}
		}
		this->slotClauseCounter = (int)clauses.size();
		return clauses;
	}

	std::vector<Clause> ConstraintBuilder::periodLimit(LiteralCounter &counter) {
		if (counter.getMaxVariable() < this->indexer.getNumFacts()) {
			throw EncodingError("ConstraintBuilder: literal counter at " + std::to_string(counter.getMaxVariable()) +
				" would reuse fact variables (" + std::to_string(this->indexer.getNumFacts()) + " facts)");
		}
		std::vector<Clause> clauses;
		for (int t = 1; t <= this->indexer.getNumTeams(); t++) {
			for (int p = 1; p <= this->indexer.getNumPeriods(); p++) {
				auto enc = CardinalityEncoder::atMost(this->indexer.getTeamPeriodVariables(t, p),
					MAX_MATCHES_PER_PERIOD, counter);
				this->auxiliaryLiteralCounter += (int)enc.auxiliaryVariables.size();
				for (auto &c : enc.clauses) clauses.emplace_back(std::move(c));
			}
		}
		this->periodLimitClauseCounter = (int)clauses.size();
		return clauses;
	}

	std::vector<Clause> ConstraintBuilder::weekHasMatch() {
		std::vector<Clause> clauses;
		for (int w = 1; w <= this->indexer.getNumWeeks(); w++) {
			Clause c;
			for (int p = 1; p <= this->indexer.getNumPeriods(); p++) {
				auto vars = this->indexer.getSlotVariables(w, p);
				c.insert(c.end(), vars.begin(), vars.end());
			}
			clauses.emplace_back(c);
		}
		this->weekClauseCounter = (int)clauses.size();
		return clauses;
	}

	CnfFormula ConstraintBuilder::build() {
		this->auxiliaryLiteralCounter = 0;
		LiteralCounter counter(this->indexer.getNumFacts());
		CnfFormula formula;
		if (!this->quiet) {
			std::cout << "ConstraintBuilder: creating team/week constraints" << std::endl;
		}
		formula.append(this->teamPlaysOncePerWeek());
		if (!this->quiet) {
			std::cout << "ConstraintBuilder: creating pair constraints" << std::endl;
		}
		formula.append(this->pairMeetsOnce());
		if (!this->quiet) {
			std::cout << "ConstraintBuilder: creating slot constraints" << std::endl;
		}
		formula.append(this->oneMatchPerSlot());
		if (!this->quiet) {
			std::cout << "ConstraintBuilder: creating period limit constraints" << std::endl;
		}
		formula.append(this->periodLimit(counter));
		formula.append(this->weekHasMatch());
		formula.numVariables = counter.getMaxVariable();

		// every literal must refer to a declared variable
		for (auto &c : formula.clauses) {
			for (auto &l : c) {
				if (l == 0 or l > formula.numVariables or -l > formula.numVariables) {
					throw EncodingError("ConstraintBuilder: literal " + std::to_string(l) + " outside of 1.." +
						std::to_string(formula.numVariables));
				}
			}
		}

		if (!this->quiet) {
			std::cout << "ConstraintBuilder: created formula with '" << formula.numVariables << "' literals and '"
				<< formula.clauses.size() << "' clauses" << std::endl;
			std::cout << "  '" << this->indexer.getNumFacts() << "' fact literals" << std::endl;
			std::cout << "  '" << this->auxiliaryLiteralCounter << "' counter literals" << std::endl;
			std::cout << "  '" << this->teamWeekClauseCounter << "' team/week clauses" << std::endl;
			std::cout << "  '" << this->pairClauseCounter << "' pair clauses" << std::endl;
			std::cout << "  '" << this->slotClauseCounter << "' slot clauses" << std::endl;
			std::cout << "  '" << this->periodLimitClauseCounter << "' period limit clauses" << std::endl;
			std::cout << "  '" << this->weekClauseCounter << "' week clauses" << std::endl;
		}
		return formula;
	}
}
