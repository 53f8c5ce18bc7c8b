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

#include "TournaSAT/utility/Verifier.h"
#include "TournaSAT/encoding/ConstraintBuilder.h"
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace TournaSAT {

bool verifyTournamentSchedule(const Schedule &schedule, bool quiet, std::string *firstViolation)
{
  auto n = schedule.getNumTeams();
  bool ok = true;
  auto report = [&](const std::string &s) {
    if(!quiet) std::cout << "verifyTournamentSchedule: " << s << std::endl;
    if(ok && firstViolation != nullptr) *firstViolation = s;
    ok = false;
  };

  std::map<std::pair<int,int>,int> matchesPerTeamWeek;
  std::map<std::pair<int,int>,int> matchesPerPair;
  std::map<std::pair<int,int>,int> matchesPerTeamPeriod;
  std::map<std::pair<int,int>,int> matchesPerSlot;

  for(auto &f : schedule.getFacts()) {
    matchesPerTeamWeek[{f.teamA, f.week}]++;
    matchesPerTeamWeek[{f.teamB, f.week}]++;
    matchesPerPair[{f.teamA, f.teamB}]++;
    matchesPerTeamPeriod[{f.teamA, f.period}]++;
    matchesPerTeamPeriod[{f.teamB, f.period}]++;
    matchesPerSlot[{f.week, f.period}]++;
  }

  for(int t=1; t<=n; t++) {
    for(int w=1; w<=schedule.getNumWeeks(); w++) {
      auto c = matchesPerTeamWeek[{t,w}];
      if(c != 1) report("team " + std::to_string(t) + " plays " + std::to_string(c) + " times in week " + std::to_string(w));
    }
    for(int p=1; p<=schedule.getNumPeriods(); p++) {
      auto c = matchesPerTeamPeriod[{t,p}];
      if(c > ConstraintBuilder::MAX_MATCHES_PER_PERIOD) report("team " + std::to_string(t) + " plays " + std::to_string(c) + " times in period " + std::to_string(p));
    }
  }

  for(int a=1; a<=n; a++) {
    for(int b=a+1; b<=n; b++) {
      auto c = matchesPerPair[{a,b}];
      if(c != 1) report("teams " + std::to_string(a) + " and " + std::to_string(b) + " meet " + std::to_string(c) + " times");
    }
  }

  for(auto &it : matchesPerSlot) {
    if(it.second > 1) report("week " + std::to_string(it.first.first) + " period " + std::to_string(it.first.second) + " hosts " + std::to_string(it.second) + " matches");
  }

  return ok;
}

}
