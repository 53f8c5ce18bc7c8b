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

#ifndef TOURNASAT_SOLVERVERDICT_H
#define TOURNASAT_SOLVERVERDICT_H

#include <utility>
#include <vector>

namespace TournaSAT {
	/*!
	 * \brief SolverVerdict answer of a SAT solver: satisfiable with a model, or unsatisfiable
	 */
	class SolverVerdict {
	public:
		enum Status {
			SATISFIABLE,
			UNSATISFIABLE
		};

		static SolverVerdict satisfiable(std::vector<int> assignment) {
			return SolverVerdict(SATISFIABLE, std::move(assignment));
		}
		static SolverVerdict unsatisfiable() {
			return SolverVerdict(UNSATISFIABLE, std::vector<int>());
		}

		Status getStatus() const { return this->status; }
		bool isSatisfiable() const { return this->status == SATISFIABLE; }
		/*!
		 * @return signed literals of the model (empty if unsatisfiable); unlisted variables are false
		 */
		const std::vector<int> &getAssignment() const { return this->assignment; }

	private:
		SolverVerdict(Status status, std::vector<int> assignment) : status(status), assignment(std::move(assignment)) {}

		Status status;
		std::vector<int> assignment;
	};
}

#endif //TOURNASAT_SOLVERVERDICT_H
