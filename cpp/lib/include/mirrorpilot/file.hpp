/**************************************************************************
*   Copyright (C) 2010-2014 by Eugene V. Lyubimkin                        *
*                                                                         *
*   This program is free software; you can redistribute it and/or modify  *
*   it under the terms of the GNU General Public License                  *
*   (version 3 or above) as published by the Free Software Foundation.    *
*                                                                         *
*   This program is distributed in the hope that it will be useful,       *
*   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
*   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
*   GNU General Public License for more details.                          *
*                                                                         *
*   You should have received a copy of the GNU GPL                        *
*   along with this program; if not, write to the                         *
*   Free Software Foundation, Inc.,                                       *
*   51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA               *
**************************************************************************/
#ifndef MIRRORPILOT_FILE_SEEN
#define MIRRORPILOT_FILE_SEEN

/// @file

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {

namespace internal {

struct FileImpl;

}

/// high-level interface to file and shell pipe routines
class MIRRORPILOT_API File
{
	internal::FileImpl* __impl;

	File(const File&) = delete;
 public:
	/// constructor
	/**
	 * Constructs new object for a regular file or a shell pipe.
	 *
	 * @warning You must not use constructed object if @a error is not empty.
	 *
	 * @param path path to file or shell command, see @a mode
	 * @param mode any value, accepted as @a mode in @c fopen(3); or @c "pr" /
	 *   @c "pw" - special values to treat @a path as shell pipe with an opened
	 *   handle for reading / writing, respectively
	 * @param [out] error if open fails, human readable error will be placed here
	 */
	File(const string& path, const char* mode, string& error);
	File(File&&);
	/// destructor
	/**
	 * Closes the file or the pipe if it was not closed explicitly. Problems
	 * are reported as warnings here.
	 */
	virtual ~File();

	/// reads new line
	/**
	 * Reads new line. Newline character from the end is strip if present.
	 *
	 * End of file must be checked by querying @ref eof right after @ref getLine. You can use
	 * @a line only if @ref eof returned false.
	 *
	 * @param [out] line container for read data
	 * @return reference to self
	 *
	 * @par Example:
	 * @code
	 * string line;
	 * while (!file.getLine(line).eof())
	 * {
	 *   // process line
	 * }
	 * @endcode
	 */
	File& getLine(string& line);
	/// reads all available data from current position
	/**
	 * @param block container for read data
	 */
	void getFile(string& block);
	/// writes data
	void put(const string& data);
	/// flushes written data to the underlying descriptor
	void flush();
	/// checks for the end of file condition
	bool eof() const;

	/// closes the pipe and returns the wait status of the shell command
	/**
	 * Only valid for pipes. The status is the one @c pclose(3) reports, use
	 * @c WIFEXITED and friends to examine it.
	 */
	int closePipe();
	/// closes the regular file, reporting errors
	void close();
};

/// File wrapper which throws on open errors
class MIRRORPILOT_API RequiredFile: public File
{
 public:
	/*
	 * Passes @a path and @a mode to File::File(). If file failed to open (i.e.
	 * !openError.empty()), throws the exception.
	 */
	RequiredFile(const string& path, const char* mode);
};

} // namespace

#endif
