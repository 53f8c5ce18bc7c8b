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

#ifndef TOURNASAT_SOLVEROUTPUTREADER_H
#define TOURNASAT_SOLVEROUTPUTREADER_H

#include <TournaSAT/base/SolverVerdict.h>
#include <istream>
#include <string>
#include <vector>

namespace TournaSAT {
	/*!
	 * \brief SolverOutputReader parses the answer of a SAT solver
	 *
	 * Accepts the SAT competition format
	 *   c <comment>
	 *   s SATISFIABLE | s UNSATISFIABLE
	 *   v <lit> <lit> ...
	 *   v <lit> ... 0
	 * and the MiniSat result file format (status token in the first line, literals without a line marker).
	 *
	 * throws ParseError if the status is missing, a token is not a literal, the model is not terminated by 0,
	 * literals are out of range or contradict each other.
	 * throws SolverInvocationError if the solver reports UNKNOWN/INDETERMINATE.
	 */
	class SolverOutputReader {
	public:
		/*!
		 * @param numVariables number of variables of the solved formula
		 */
		explicit SolverOutputReader(int numVariables);

		SolverVerdict read(const std::string &filepath);
		SolverVerdict read(std::istream &stream);

		void setQuiet(bool q) { this->quiet = q; }

	private:
		static bool isStatusToken(const std::string &token);
		void readStatus(const std::string &token, const std::string &line);
		void readLiterals(std::istream &tokens, const std::string &line);

		int numVariables;
		bool quiet;
		bool statusFound;
		bool satisfiable;
		bool terminated;
		std::vector<int> values;
		std::vector<int> assignment;
	};
}

#endif //TOURNASAT_SOLVEROUTPUTREADER_H
