#include <dirent.h>

#include <cstdio>
#include <cstdlib>
#include <set>

// Prints the open file descriptors, one per line.
int main() {
  DIR* dir = opendir("/proc/self/fd");
  if (dir == nullptr) return 1;
  std::set<int> fds;
  while (struct dirent* entry = readdir(dir)) {
    if (entry->d_name[0] == '.') continue;
    int fd = atoi(entry->d_name);
    if (fd != dirfd(dir)) fds.insert(fd);
  }
  closedir(dir);
  for (int fd : fds) printf("%d\n", fd);
}
