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

#include "TournamentScheduler.h"
#include <TournaSAT/encoding/ConstraintBuilder.h>
#include <TournaSAT/encoding/ResultDecoder.h>
#include <TournaSAT/encoding/VariableIndexer.h>
#include <TournaSAT/utility/Exception.h>
#include <TournaSAT/utility/TemporaryFile.h>
#include <TournaSAT/utility/writer/DimacsWriter.h>
#include <iostream>

namespace TournaSAT {

	TournamentScheduler::TournamentScheduler(int numTeams, SATSolverBase &solver) : numTeams(numTeams),
		solver(solver), quiet(true), cnfPath(""), state(UNBUILT), failureKind(NO_FAILURE), failureMessage(""),
		numVariables(-1), numClauses(-1), solvingTime(-1.0) {
	}

	void TournamentScheduler::schedule() {
		if (this->state != UNBUILT) {
			throw Exception("TournamentScheduler: schedule() was already called (state " +
				stateToString(this->state) + ")");
		}
		VariableIndexer::checkNumTeams(this->numTeams);

		if (!this->quiet) {
			std::cout << "TournamentScheduler: creating formula for " << this->numTeams << " teams" << std::endl;
		}
		VariableIndexer indexer(this->numTeams);
		ConstraintBuilder builder(indexer);
		builder.setQuiet(this->quiet);
		auto formula = builder.build();
		this->numVariables = formula.numVariables;
		this->numClauses = (int)formula.clauses.size();
		this->state = BUILT;

		if (!this->cnfPath.empty()) {
			DimacsWriter(this->cnfPath, formula).write();
		}
		TemporaryFile cnfFile(".cnf");
		DimacsWriter(cnfFile.getPath(), formula).write();
		// the solver only needs the file from here on
		formula.clauses.clear();
		formula.clauses.shrink_to_fit();

		this->state = AWAITING_SOLVER;
		if (!this->quiet) {
			std::cout << "TournamentScheduler: start solving with " << this->solver.getName() << " ("
				<< this->numVariables << " literals, " << this->numClauses << " clauses)" << std::endl;
		}
		try {
			auto verdict = this->solver.solve(cnfFile.getPath());
			this->solvingTime = this->solver.getSolvingTime();
			if (!verdict.isSatisfiable()) {
				this->state = UNSATISFIABLE;
				if (!this->quiet) {
					std::cout << "TournamentScheduler: no schedule exists for " << this->numTeams << " teams" << std::endl;
				}
				return;
			}
			ResultDecoder decoder(indexer);
			decoder.setQuiet(this->quiet);
			this->result = std::unique_ptr<Schedule>(new Schedule(decoder.decode(verdict)));
			this->state = SOLVED;
			if (!this->quiet) {
				std::cout << "TournamentScheduler: found schedule after " << this->solvingTime << " sec" << std::endl;
			}
		}
		catch (SolverTimeoutError &e) {
			this->fail(SOLVER_TIMEOUT, e.msg);
		}
		catch (SolverInvocationError &e) {
			this->fail(SOLVER_INVOCATION, e.msg);
		}
		catch (ParseError &e) {
			this->fail(PARSE, e.msg);
		}
		catch (InvariantViolation &e) {
			this->fail(INVARIANT_VIOLATION, e.msg);
		}
		catch (Exception &e) {
			// e.g. the solver's files could not be created or opened
			this->fail(SOLVER_INVOCATION, e.msg);
		}
	}

	void TournamentScheduler::fail(FailureKind kind, const std::string &msg) {
		this->state = FAILED;
		this->failureKind = kind;
		this->solvingTime = this->solver.getSolvingTime();
		this->failureMessage = msg;
		this->result.reset();
		if (!this->quiet) {
			std::cout << "TournamentScheduler: failed (" << failureKindToString(kind) << "): " << msg << std::endl;
		}
	}

	const Schedule &TournamentScheduler::getSchedule() const {
		if (this->state != SOLVED or !this->result) {
			throw Exception("TournamentScheduler::getSchedule: no schedule available (state " +
				stateToString(this->state) + ")");
		}
		return *this->result;
	}

	std::string TournamentScheduler::stateToString(State s) {
		switch (s) {
			case UNBUILT: return "UNBUILT";
			case BUILT: return "BUILT";
			case AWAITING_SOLVER: return "AWAITING_SOLVER";
			case SOLVED: return "SOLVED";
			case UNSATISFIABLE: return "UNSATISFIABLE";
			case FAILED: return "FAILED";
		}
		return "UNKNOWN";
	}

	std::string TournamentScheduler::failureKindToString(FailureKind k) {
		switch (k) {
			case NO_FAILURE: return "none";
			case SOLVER_INVOCATION: return "solver invocation error";
			case SOLVER_TIMEOUT: return "solver timeout";
			case PARSE: return "parse error";
			case INVARIANT_VIOLATION: return "invariant violation";
		}
		return "unknown";
	}
}
