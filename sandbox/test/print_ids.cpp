#include <stdio.h>
#include <unistd.h>

int main() {
  printf("%d %d\n", static_cast<int>(getuid()), static_cast<int>(getgid()));
  return 0;
}
