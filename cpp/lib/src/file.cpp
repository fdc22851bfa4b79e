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
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>

#include <mirrorpilot/file.hpp>

#include <internal/common.hpp>

namespace mirrorpilot {
namespace internal {

struct FileImpl
{
	FILE* handle;
	const string path;
	bool isPipe;
	bool eof;
	char* lineBuffer;
	size_t lineBufferSize;

	FileImpl(const string& path_, const char* mode, string& openError);
	~FileImpl();
	void assertFileOpened() const;
	bool readLine(string& line);
	int close();
};

FileImpl::FileImpl(const string& path_, const char* mode, string& openError)
	: handle(NULL), path(path_), isPipe(false), eof(false),
	lineBuffer(NULL), lineBufferSize(0)
{
	if (mode[0] == 'p')
	{
		if (strlen(mode) != 2)
		{
			fatal2(__("pipe specification mode should be exactly 2 characters"));
		}
		isPipe = true;
		handle = popen(path.c_str(), mode+1);
	}
	else
	{
		handle = fopen(path.c_str(), mode);
	}

	if (!handle)
	{
		openError = format2e("").substr(2);
	}
	else
	{
		int fd = fileno(handle);
		if (fd == -1)
		{
			openError = format2e("unable to get the file descriptor");
			return;
		}
		int oldFdFlags = fcntl(fd, F_GETFD);
		if (oldFdFlags < 0)
		{
			openError = format2e("unable to get file descriptor flags");
		}
		else if (fcntl(fd, F_SETFD, oldFdFlags | FD_CLOEXEC) == -1)
		{
			openError = format2e("unable to set the close-on-exec flag");
		}
	}
}

FileImpl::~FileImpl()
{
	free(lineBuffer);
	if (handle)
	{
		auto closeResult = close();
		if (closeResult == -1)
		{
			warn2e(__("unable to close the file '%s'"), path);
		}
		else if (isPipe && closeResult)
		{
			warn2(__("execution of the pipe '%s' failed: %s"), path, getWaitStatusDescription(closeResult));
		}
	}
}

int FileImpl::close()
{
	int result = isPipe ? pclose(handle) : fclose(handle);
	handle = NULL;
	return result;
}

void FileImpl::assertFileOpened() const
{
	if (!handle)
	{
		fatal2i("file '%s' was not properly opened", path);
	}
}

bool FileImpl::readLine(string& line)
{
	errno = 0;
	auto readResult = getline(&lineBuffer, &lineBufferSize, handle);
	if (readResult == -1)
	{
		if (errno != 0 && errno != EINTR)
		{
			fatal2e(__("unable to read from the file '%s'"), path);
		}
		eof = true;
		return false;
	}
	line.assign(lineBuffer, readResult);
	return true;
}

}

File::File(const string& path, const char* mode, string& openError)
	: __impl(new internal::FileImpl(path, mode, openError))
{}

File::File(File&& other)
	: __impl(other.__impl)
{
	other.__impl = nullptr;
}

File::~File()
{
	delete __impl;
}

File& File::getLine(string& line)
{
	__impl->assertFileOpened();
	if (__impl->readLine(line))
	{
		if (!line.empty() && *line.rbegin() == '\n')
		{
			line.erase(line.size() - 1);
		}
	}
	return *this;
}

void File::getFile(string& block)
{
	__impl->assertFileOpened();

	block.clear();
	string line;
	while (__impl->readLine(line))
	{
		block += line;
	}
}

bool File::eof() const
{
	return __impl->eof;
}

void File::put(const string& data)
{
	__impl->assertFileOpened();
	if (!data.empty() && fwrite(data.c_str(), data.size(), 1, __impl->handle) != 1)
	{
		fatal2e(__("unable to write to the file '%s'"), __impl->path);
	}
}

void File::flush()
{
	__impl->assertFileOpened();
	if (fflush(__impl->handle) == EOF)
	{
		fatal2e(__("unable to write to the file '%s'"), __impl->path);
	}
}

int File::closePipe()
{
	__impl->assertFileOpened();
	if (!__impl->isPipe)
	{
		fatal2i("an attempt to close the regular file '%s' as a pipe", __impl->path);
	}
	auto status = __impl->close();
	if (status == -1)
	{
		fatal2e(__("unable to close the pipe '%s'"), __impl->path);
	}
	return status;
}

void File::close()
{
	__impl->assertFileOpened();
	if (__impl->close() != 0)
	{
		fatal2e(__("unable to close the file '%s'"), __impl->path);
	}
}

namespace {

File openRequiredFile(const string& path, const char* mode)
{
	string openError;
	File file(path, mode, openError);
	if (!openError.empty())
	{
		fatal2(__("unable to open the file '%s': %s"), path, openError);
	}
	return file;
}

}

RequiredFile::RequiredFile(const string& path, const char* mode)
	: File(openRequiredFile(path, mode))
{}

} // namespace
