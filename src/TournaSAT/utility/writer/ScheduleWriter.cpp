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

#include "ScheduleWriter.h"
#include <TournaSAT/utility/Exception.h>
#include <fstream>

namespace TournaSAT {
	ScheduleWriter::ScheduleWriter(std::string path, const Schedule &schedule) :
		Writer(path), schedule(schedule), solvingTime(-1.0), numVariables(-1), numClauses(-1)
	{}

	void ScheduleWriter::write() {
		if(this->path.empty()) {
			throw Exception("ScheduleWriter::write: specify path -> currently empty");
		}
		std::ofstream file;
		file.open(this->path.c_str());
		if(!file.is_open()) {
			throw Exception("ScheduleWriter::write: can't open file at location '"+this->path+"'");
		}

		file << "# teams " << this->schedule.getNumTeams() << std::endl;
		file << "# weeks " << this->schedule.getNumWeeks() << std::endl;
		file << "# periods " << this->schedule.getNumPeriods() << std::endl;
		if(this->numVariables >= 0) {
			file << "# variables " << this->numVariables << std::endl;
		}
		if(this->numClauses >= 0) {
			file << "# clauses " << this->numClauses << std::endl;
		}
		if(this->solvingTime >= 0.0) {
			file << "# solvingTime " << this->solvingTime << std::endl;
		}
		file << "# week;period;home;away" << std::endl;
		for(auto &f : this->schedule.getFacts()) {
			file << f.week << ";" << f.period << ";" << f.getHomeTeam() << ";" << f.getAwayTeam() << std::endl;
		}
		file.close();
	}
}
