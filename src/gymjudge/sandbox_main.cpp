#include <errno.h>
#include <unistd.h>

#include "sandbox_options.h"

namespace {

bool ReadAll(int fd, void* buf, size_t size) {
  char* ptr = static_cast<char*>(buf);
  while (size) {
    ssize_t n = read(fd, ptr, size);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n;
    size -= n;
  }
  return true;
}

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  auto ctx = opt.ToCJailCtx();
  struct cjail_result ret = {};
  if (cjail_exec(&ctx->GetCtx(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

} // namespace

// stdin: serialized SandboxOptions; stdout: raw cjail_result
int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz < 0) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  struct cjail_result res = SandboxExec(SandboxOptions(buf));
  if (write(1, &res, sizeof(res)) != (ssize_t)sizeof(res)) return 1;
}
