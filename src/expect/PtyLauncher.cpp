#include "PtyLauncher.hpp"

#include "Errors.hpp"

namespace uex {
namespace {
// forkpty() cannot create the master close-on-exec, so a concurrent launch
// could inherit it between the fork and setCloseOnExec().
std::mutex launchMutex;

void setCloseOnExec(int fd) {
  int flags = fcntl(fd, F_GETFD);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}
}  // namespace

PtyChild PtyLauncher::launch(const vector<string>& argv) {
  if (argv.empty()) {
    throw LaunchError("Cannot launch an empty command", 0);
  }

  // Everything the child needs is built before forking
  vector<char*> argsArray;
  for (const auto& arg : argv) {
    argsArray.push_back(const_cast<char*>(arg.c_str()));
  }
  argsArray.push_back(NULL);

  // The child reports a failed exec through this pipe. A successful exec
  // closes the write side and the parent reads EOF.
  int statusPipe[2];
  if (pipe2(statusPipe, O_CLOEXEC) == -1) {
    throw LaunchError("Cannot create status pipe", GetErrno());
  }

  unique_lock<std::mutex> launchLock(launchMutex);
  int masterFd = -1;
  pid_t pid = forkpty(&masterFd, NULL, NULL, NULL);
  switch (pid) {
    case -1: {
      int forkErrno = GetErrno();
      launchLock.unlock();
      ::close(statusPipe[0]);
      ::close(statusPipe[1]);
      throw LaunchError("Cannot fork a pseudo-terminal", forkErrno);
    }
    case 0: {
      // child
      ::close(statusPipe[0]);
      // Do not leak an ignored SIGCHLD or SIGPIPE disposition into the
      // command.
      signal(SIGCHLD, SIG_DFL);
      signal(SIGPIPE, SIG_DFL);
      execvp(argsArray[0], argsArray.data());
      int execErrno = errno;
      ssize_t ignored = ::write(statusPipe[1], &execErrno, sizeof(execErrno));
      (void)ignored;
      _exit(127);
    }
    default: {
      // parent
    }
  }

  setCloseOnExec(masterFd);
  launchLock.unlock();
  ::close(statusPipe[1]);

  int execErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(statusPipe[0], &execErrno, sizeof(execErrno));
  } while (rc == -1 && GetErrno() == EINTR);
  ::close(statusPipe[0]);

  if (rc == sizeof(execErrno)) {
    ::close(masterFd);
    int throwaway;
    waitpid(pid, &throwaway, 0);
    throw LaunchError("Cannot execute " + argv[0], execErrno);
  }

  VLOG(1) << "pty opened " << masterFd << " for pid " << pid << " running "
          << argv[0];
  return PtyChild{pid, masterFd};
}
}  // namespace uex
