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

#ifndef TOURNASAT_TOURNAMENTSCHEDULER_H
#define TOURNASAT_TOURNAMENTSCHEDULER_H

#include <TournaSAT/base/SATSolverBase.h>
#include <TournaSAT/scheduler/Schedule.h>
#include <memory>
#include <string>

namespace TournaSAT {

	/*!
	 * \brief TournamentScheduler computes a round-robin schedule for an even number of teams
	 *
	 * encode -> write DIMACS -> SAT solver -> decode and verify
	 *
	 * Every instance handles exactly one schedule() call.
	 */
	class TournamentScheduler {
	public:
		enum State {
			UNBUILT,
			BUILT,
			AWAITING_SOLVER,
			SOLVED,
			UNSATISFIABLE,
			FAILED
		};

		enum FailureKind {
			NO_FAILURE,
			SOLVER_INVOCATION,
			SOLVER_TIMEOUT,
			PARSE,
			INVARIANT_VIOLATION
		};

		/*!
		 * @param numTeams number of teams, checked in schedule()
		 * @param solver SAT solver backend, must outlive the scheduler
		 */
		TournamentScheduler(int numTeams, SATSolverBase &solver);

		/*!
		 * run the pipeline
		 * throws InvalidInputError (odd or too small team count) or EncodingError before the solver is called;
		 * solver related problems end in state FAILED, see getFailureKind()/getFailureMessage()
		 */
		void schedule();

		State getState() const { return this->state; }
		bool getScheduleFound() const { return this->state == SOLVED; }
		/*!
		 * throws Exception if no schedule was found
		 * @return the verified schedule
		 */
		const Schedule &getSchedule() const;
		FailureKind getFailureKind() const { return this->failureKind; }
		const std::string &getFailureMessage() const { return this->failureMessage; }

		int getNumTeams() const { return this->numTeams; }
		int getNumVariables() const { return this->numVariables; }
		int getNumClauses() const { return this->numClauses; }
		double getSolvingTime() const { return this->solvingTime; }

		void setQuiet(bool q) { this->quiet = q; }
		/*!
		 * keep a copy of the formula in a DIMACS file
		 * @param path
		 */
		void setCNFPath(const std::string &path) { this->cnfPath = path; }

		static std::string stateToString(State s);
		static std::string failureKindToString(FailureKind k);

	private:
		void fail(FailureKind kind, const std::string &msg);

		int numTeams;
		SATSolverBase &solver;
		bool quiet;
		std::string cnfPath;
		State state;
		FailureKind failureKind;
		std::string failureMessage;
		int numVariables;
		int numClauses;
		double solvingTime;
		std::unique_ptr<Schedule> result;
	};
}

#endif //TOURNASAT_TOURNAMENTSCHEDULER_H
