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

#include "CaDiCaLSATSolver.h"

#ifdef USE_CADICAL
#include <TournaSAT/utility/Exception.h>
#include <TournaSAT/utility/reader/DimacsReader.h>
#include <iostream>
#include <vector>

#define CADICAL_SAT 10
#define CADICAL_UNSAT 20

namespace TournaSAT {

	CaDiCaLSATSolver::CaDiCaLSATSolver() : SATSolverBase(), terminator(0.0) {
	}

	SolverVerdict CaDiCaLSATSolver::solve(const std::string &cnfPath) {
		this->solvingTime = -1.0;
		auto formula = DimacsReader::read(cnfPath);
		// just create a new solver for every formula
		this->solver = std::unique_ptr<CaDiCaL::Solver>(new CaDiCaL::Solver);
		this->terminator.restart(this->solverTimeout);
		this->solver->connect_terminator(&this->terminator);
		if (!this->quiet) {
			std::cout << "CaDiCaLSATSolver: adding " << formula.clauses.size() << " clauses over "
				<< formula.numVariables << " literals" << std::endl;
		}
		for (auto &c : formula.clauses) {
			for (auto &l : c) {
				this->solver->add(l);
			}
			this->solver->add(0);
		}
		auto stat = this->solver->solve();
		this->solvingTime = this->terminator.getElapsedTime();
		this->solver->disconnect_terminator();
		if (!this->quiet) {
			std::cout << "CaDiCaLSATSolver: finished solving with code '" << stat << "' after " << this->solvingTime
				<< " sec" << std::endl;
		}
		if (stat == CADICAL_UNSAT) {
			return SolverVerdict::unsatisfiable();
		}
		if (stat != CADICAL_SAT) {
			if (this->terminator.hasStoppedSolver()) {
				throw SolverTimeoutError("CaDiCaLSATSolver: encountered timeout after " +
					std::to_string(this->solvingTime) + " sec (time budget was " +
					std::to_string(this->solverTimeout) + " sec)");
			}
			throw SolverInvocationError("CaDiCaLSATSolver: unexpected return value " + std::to_string(stat));
		}
		std::vector<int> assignment;
		for (int v = 1; v <= formula.numVariables; v++) {
			// Solver variable starts at 1, negated variables are shown as negative numbers
			assignment.emplace_back(this->solver->val(v) > 0 ? v : -v);
		}
		return SolverVerdict::satisfiable(assignment);
	}
}
#endif
