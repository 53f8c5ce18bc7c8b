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

#ifndef TOURNASAT_RESULTDECODER_H
#define TOURNASAT_RESULTDECODER_H

#include <TournaSAT/base/SolverVerdict.h>
#include <TournaSAT/encoding/VariableIndexer.h>
#include <TournaSAT/scheduler/Schedule.h>

namespace TournaSAT {
	/*!
	 * \brief ResultDecoder translates a satisfying assignment into a verified schedule
	 */
	class ResultDecoder {
	public:
		explicit ResultDecoder(const VariableIndexer &indexer);
		/*!
		 * true fact variables become matches, counter variables are skipped
		 * throws InvariantViolation if the resulting schedule is not a valid tournament
		 * @param verdict a satisfiable verdict
		 * @return the schedule
		 */
		Schedule decode(const SolverVerdict &verdict) const;
		void setQuiet(bool q) { this->quiet = q; }
	private:
		const VariableIndexer &indexer;
		bool quiet;
	};
}

#endif //TOURNASAT_RESULTDECODER_H
