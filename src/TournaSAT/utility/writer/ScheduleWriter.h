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

#ifndef TOURNASAT_SCHEDULEWRITER_H
#define TOURNASAT_SCHEDULEWRITER_H

#include <TournaSAT/utility/writer/Writer.h>
#include <TournaSAT/scheduler/Schedule.h>

namespace TournaSAT {
	/*!
	 * \brief ScheduleWriter writes a tournament schedule into a csv file
	 *
	 * header lines start with '#', one line "week;period;home;away" per match follows
	 */
	class ScheduleWriter : public Writer {
	public:
		ScheduleWriter(std::string path, const Schedule &schedule);
		void write() override;
		void setSolvingTime(double t) { this->solvingTime = t; }
		void setFormulaSize(int variables, int clauses) { this->numVariables = variables; this->numClauses = clauses; }
	private:
		const Schedule &schedule;
		double solvingTime;
		int numVariables;
		int numClauses;
	};
}

#endif //TOURNASAT_SCHEDULEWRITER_H
