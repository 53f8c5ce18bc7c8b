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

#include "ResultDecoder.h"
#include <TournaSAT/utility/Exception.h>
#include <TournaSAT/utility/Verifier.h>
#include <iostream>
#include <string>
#include <vector>

namespace TournaSAT {
	ResultDecoder::ResultDecoder(const VariableIndexer &indexer) : indexer(indexer), quiet(true) {
	}

	Schedule ResultDecoder::decode(const SolverVerdict &verdict) const {
		if (!verdict.isSatisfiable()) {
			throw Exception("ResultDecoder: can't decode an unsatisfiable verdict");
		}
		std::vector<Fact> facts;
		for (auto &lit : verdict.getAssignment()) {
			if (lit <= 0) continue;
			if (!this->indexer.isPrimary(lit)) continue;
			facts.emplace_back(this->indexer.getFact(lit));
		}
		if (!this->quiet) {
			std::cout << "ResultDecoder: found " << facts.size() << " matches in the model" << std::endl;
		}
		Schedule schedule(this->indexer.getNumTeams(), facts);
		std::string violation;
		if (!verifyTournamentSchedule(schedule, this->quiet, &violation)) {
			throw InvariantViolation("ResultDecoder: decoded schedule is invalid: " + violation);
		}
		return schedule;
	}
}
