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

#include "TemporaryFile.h"
#include <TournaSAT/utility/Exception.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace TournaSAT {
	TemporaryFile::TemporaryFile(const std::string &suffix) {
		std::string dir = "/tmp";
		auto env = std::getenv("TMPDIR");
		if (env != nullptr and env[0] != '\0') dir = env;
		auto pattern = dir + "/tournasat-XXXXXX" + suffix;
		std::vector<char> buf(pattern.begin(), pattern.end());
		buf.push_back('\0');
		auto fd = mkstemps(buf.data(), (int)suffix.size());
		if (fd < 0) {
			throw Exception("TemporaryFile: can't create '" + pattern + "': " + std::strerror(errno));
		}
		close(fd);
		this->path = std::string(buf.data());
	}

	TemporaryFile::~TemporaryFile() {
		std::remove(this->path.c_str());
	}
}
