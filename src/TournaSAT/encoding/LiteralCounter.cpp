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

#include "LiteralCounter.h"
#include <TournaSAT/utility/Exception.h>
#include <limits>
#include <string>

namespace TournaSAT {
	LiteralCounter::LiteralCounter(int maxUsedVariable) : maxVariable(maxUsedVariable) {
		if (maxUsedVariable < 0) {
			throw EncodingError("LiteralCounter: invalid start value " + std::to_string(maxUsedVariable));
		}
	}

	int LiteralCounter::getFreshVariable() {
		if (this->maxVariable == std::numeric_limits<int>::max()) {
			throw EncodingError("LiteralCounter: ran out of variable ids");
		}
		return ++this->maxVariable;
	}
}
