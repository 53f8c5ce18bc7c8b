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

#ifndef TOURNASAT_EXTERNALSATSOLVER_H
#define TOURNASAT_EXTERNALSATSOLVER_H

#include <TournaSAT/base/SATSolverBase.h>
#include <string>
#include <vector>

namespace TournaSAT {

	/*!
	 * \brief ExternalSATSolver runs a SAT solver executable as a child process
	 *
	 * The command line is "<executable> <arguments...> <cnf file>". The solver's stdout is captured in a temporary
	 * file and parsed by the SolverOutputReader. Exit codes 10 (SAT), 20 (UNSAT) and 0 are accepted.
	 * The child is killed when the solver timeout expires.
	 */
	class ExternalSATSolver : public SATSolverBase {
	public:
		/*!
		 * @param executable name (searched in PATH) or path of the solver binary
		 * @param arguments extra arguments placed before the formula path
		 */
		ExternalSATSolver(std::string executable, std::vector<std::string> arguments = std::vector<std::string>());

		SolverVerdict solve(const std::string &cnfPath) override;
		std::string getName() override { return "External(" + this->executable + ")"; }

		void setArguments(const std::vector<std::string> &args) { this->arguments = args; }
		const std::vector<std::string> &getArguments() const { return this->arguments; }

		/*!
		 * resolve the executable like a shell would
		 * @return full path or empty string if no executable was found
		 */
		std::string locateExecutable() const;

	private:
		/*!
		 * fork and exec the solver, one retry if fork fails temporarily
		 * @return pid of the child
		 */
		int startProcess(const std::string &executablePath, const std::string &cnfPath, const std::string &outputPath);
		/*!
		 * wait for the child, kill it when the timeout expires
		 * @return raw wait status
		 */
		int waitForProcess(int pid);

		std::string executable;
		std::vector<std::string> arguments;
	};
}

#endif //TOURNASAT_EXTERNALSATSOLVER_H
