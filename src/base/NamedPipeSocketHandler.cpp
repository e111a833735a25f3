#include "NamedPipeSocketHandler.hpp"

#include "Errors.hpp"

namespace dw {
NamedPipeSocketHandler::NamedPipeSocketHandler() {}

#ifdef WIN32
HANDLE NamedPipeSocketHandler::getHandle(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (shutdownPipes.find(fd) != shutdownPipes.end()) {
    return INVALID_HANDLE_VALUE;
  }
  auto it = pipeHandles.find(fd);
  if (it == pipeHandles.end()) {
    return INVALID_HANDLE_VALUE;
  }
  return it->second;
}

bool NamedPipeSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::seconds(sec) + std::chrono::microseconds(usec);
  while (true) {
    HANDLE handle = getHandle(fd);
    if (handle == INVALID_HANDLE_VALUE) {
      // Let read() report the closed pipe
      return true;
    }
    DWORD available = 0;
    if (!PeekNamedPipe(handle, NULL, 0, NULL, &available, NULL)) {
      // Broken pipe reads as EOF
      return true;
    }
    if (available > 0) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

ssize_t NamedPipeSocketHandler::read(int fd, void* buf, size_t count) {
  HANDLE handle = getHandle(fd);
  if (handle == INVALID_HANDLE_VALUE) {
    SetErrno(EPIPE);
    return -1;
  }
  DWORD bytesRead = 0;
  if (!ReadFile(handle, buf, (DWORD)count, &bytesRead, NULL)) {
    auto error = GetLastError();
    if (error == ERROR_BROKEN_PIPE || error == ERROR_PIPE_NOT_CONNECTED) {
      return 0;
    }
    LOG(WARNING) << "Error reading from pipe: " << WinErrnoToString();
    SetErrno(ECONNRESET);
    return -1;
  }
  return bytesRead;
}

ssize_t NamedPipeSocketHandler::write(int fd, const void* buf, size_t count) {
  HANDLE handle = getHandle(fd);
  if (handle == INVALID_HANDLE_VALUE) {
    SetErrno(EPIPE);
    return -1;
  }
  DWORD bytesWritten = 0;
  if (!WriteFile(handle, buf, (DWORD)count, &bytesWritten, NULL)) {
    LOG(WARNING) << "Error writing to pipe: " << WinErrnoToString();
    SetErrno(EPIPE);
    return -1;
  }
  return bytesWritten;
}

int NamedPipeSocketHandler::connect(const DaemonAddress& address) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  const string& pipePath = address.getPath();
  HANDLE handle = INVALID_HANDLE_VALUE;
  for (int attempt = 0; attempt < 2; attempt++) {
    handle = CreateFileA(pipePath.c_str(), GENERIC_READ | GENERIC_WRITE, 0,
                         NULL, OPEN_EXISTING, 0, NULL);
    if (handle != INVALID_HANDLE_VALUE) {
      break;
    }
    if (GetLastError() != ERROR_PIPE_BUSY) {
      break;
    }
    VLOG(1) << "Pipe " << pipePath << " is busy, waiting";
    if (!WaitNamedPipeA(pipePath.c_str(), 3000)) {
      break;
    }
  }
  if (handle == INVALID_HANDLE_VALUE) {
    LOG(INFO) << "Error connecting to " << address << ": "
              << WinErrnoToString();
    SetErrno(ENOENT);
    return -1;
  }
  int fd = _open_osfhandle((intptr_t)handle, 0);
  if (fd == -1) {
    CloseHandle(handle);
    SetErrno(EMFILE);
    return -1;
  }
  LOG(INFO) << "Connected to endpoint " << address;
  pipeHandles[fd] = handle;
  return fd;
}

void NamedPipeSocketHandler::shutdown(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = pipeHandles.find(fd);
  if (it == pipeHandles.end()) {
    return;
  }
  shutdownPipes.insert(fd);
  CancelIoEx(it->second, NULL);
}

void NamedPipeSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = pipeHandles.find(fd);
  if (it == pipeHandles.end()) {
    STERROR << "Tried to close a pipe that doesn't exist: " << fd;
    return;
  }
  VLOG(1) << "Closing pipe: " << fd;
  // Closing the CRT descriptor also closes the pipe handle
  ::_close(fd);
  pipeHandles.erase(it);
  shutdownPipes.erase(fd);
}
#else
bool NamedPipeSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  return false;
}

ssize_t NamedPipeSocketHandler::read(int fd, void* buf, size_t count) {
  SetErrno(EBADF);
  return -1;
}

ssize_t NamedPipeSocketHandler::write(int fd, const void* buf, size_t count) {
  SetErrno(EBADF);
  return -1;
}

int NamedPipeSocketHandler::connect(const DaemonAddress& address) {
  throw TransportUnavailable("Named pipes are only supported on Windows: " +
                             address.toString());
}

void NamedPipeSocketHandler::shutdown(int fd) {}

void NamedPipeSocketHandler::close(int fd) {
  STERROR << "Tried to close a pipe that doesn't exist: " << fd;
}
#endif
}  // namespace dw
