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

#ifndef TOURNASAT_SATSOLVERBASE_H
#define TOURNASAT_SATSOLVERBASE_H

#include <TournaSAT/base/SolverVerdict.h>
#include <string>

namespace TournaSAT {

	/*!
	 * \brief SATSolverBase interface of all SAT solver backends
	 *
	 * A backend receives a formula in DIMACS CNF format and returns the verdict. It never sees schedule facts.
	 */
	class SATSolverBase {
	public:
		SATSolverBase();
		virtual ~SATSolverBase();

		/*!
		 * solve the formula stored in the given file
		 * throws SolverInvocationError, SolverTimeoutError or ParseError if solving fails
		 * @param cnfPath path to a DIMACS CNF file
		 * @return satisfiable with model or unsatisfiable
		 */
		virtual SolverVerdict solve(const std::string &cnfPath) = 0;
		virtual std::string getName() = 0;

		/*!
		 * @param seconds time budget for one solve() call, <= 0 disables the timeout
		 */
		void setSolverTimeout(double seconds) { this->solverTimeout = seconds; }
		double getSolverTimeout() const { return this->solverTimeout; }
		void setQuiet(bool q) { this->quiet = q; }
		/*!
		 * @return wall clock time of the last solve() call in seconds
		 */
		double getSolvingTime() const { return this->solvingTime; }

	protected:
		double solverTimeout;
		bool quiet;
		double solvingTime;
	};
}

#endif //TOURNASAT_SATSOLVERBASE_H
