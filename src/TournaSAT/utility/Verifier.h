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

#pragma once

#include "TournaSAT/scheduler/Schedule.h"
#include <string>

/*!
 * \namespace TournaSAT
 * \brief The main namespace for all TournaSAT components
 */
namespace TournaSAT {

/*!
 * \brief Verifies the given tournament schedule
 *
 * Checks that
 *  - every team plays exactly once per week,
 *  - every pair of teams meets exactly once,
 *  - no team plays more than twice in the same period,
 *  - every week and period hosts at most one match.
 *
 * @param schedule the decoded schedule
 * @param quiet suppress the report of violations on stdout
 * @param firstViolation if not null, receives a description of the first violation found
 * @return true iff the schedule is valid
 */
bool verifyTournamentSchedule(const Schedule &schedule, bool quiet = false, std::string *firstViolation = nullptr);

}
