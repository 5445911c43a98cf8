#include "sandbox_options.h"

#include <unistd.h>
#include <sys/mount.h>
#include <cstring>
#include <memory>
#include <algorithm>
#include <filesystem>

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& vec) {
  size_t cur = 0;
  auto ReadInt = [&]() {
    Int r;
    memcpy(&r, vec.data() + cur, sizeof(Int));
    cur += sizeof(Int);
    return r;
  };
  auto ReadString = [&]() {
    Int size = ReadInt();
    std::string str(size, '\0');
    memcpy(str.data(), vec.data() + cur, size);
    cur += size;
    return str;
  };
  auto ReadStrings = [&](std::vector<std::string>& out) {
    out.resize(ReadInt());
    for (auto& i : out) i = ReadString();
  };
  boxdir = ReadString();
  ReadStrings(command);
  ReadStrings(envs);
  workdir = ReadString();
  input = ReadString();
  fd_output = ReadInt();
  fd_error = ReadInt();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  rss = ReadInt();
  proc_num = ReadInt();
  file_num = ReadInt();
  fsize = ReadInt();
  share_net = ReadInt();
  ReadStrings(dirs);
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  auto PushInt = [&](Int r) {
    size_t cur = ret.size();
    ret.resize(cur + sizeof(Int));
    memcpy(ret.data() + cur, &r, sizeof(Int));
  };
  auto PushString = [&](const std::string& str) {
    PushInt(str.size());
    ret.insert(ret.end(), str.begin(), str.end());
  };
  auto PushStrings = [&](const std::vector<std::string>& strs) {
    PushInt(strs.size());
    for (auto& i : strs) PushString(i);
  };
  PushString(boxdir);
  PushStrings(command);
  PushStrings(envs);
  PushString(workdir);
  PushString(input);
  PushInt(fd_output);
  PushInt(fd_error);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(rss);
  PushInt(proc_num);
  PushInt(file_num);
  PushInt(fsize);
  PushInt(share_net);
  PushStrings(dirs);
  return ret;
}

void SandboxOptions::FilterDirs() {
  dirs.erase(std::remove_if(dirs.begin(), dirs.end(), [](const std::string& dir) {
    std::error_code ec;
    return !std::filesystem::is_directory(dir, ec);
  }), dirs.end());
}

std::unique_ptr<CJailCtxClass> SandboxOptions::ToCJailCtx() const {
  auto ret = std::make_unique<CJailCtxClass>();
  struct cjail_ctx& ctx = ret->ctx_;
  cjail_ctx_init(&ctx);
  ctx.sharenet = share_net;
  // default: preservefd
  ctx.redir_input = const_cast<char*>(input.empty() ? "/dev/null" : input.c_str());
  if (fd_output != -1) {
    ctx.fd_output = fd_output;
  } else {
    ctx.redir_output = const_cast<char*>("/dev/null");
  }
  if (fd_error != -1) {
    ctx.fd_error = fd_error;
  } else {
    ctx.redir_error = const_cast<char*>("/dev/null");
  }
  for (auto& i : command) ret->argv_buf_.push_back(i.c_str());
  ret->argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret->argv_buf_.data());
  for (auto& i : envs) ret->env_buf_.push_back(i.c_str());
  ret->env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret->env_buf_.data());
  ctx.chroot = const_cast<char*>(boxdir.c_str());
  ctx.working_dir = const_cast<char*>(workdir.c_str());
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  // bind mounts; str_buf_ must not reallocate after its strings are referenced
  ret->str_buf_.reserve(dirs.size());
  ret->mnt_buf_.reserve(dirs.size());
  for (auto& i : dirs) {
    ret->mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret->mnt_buf_.back();
    ret->str_buf_.push_back("bind");
    mnt_ctx.type = ret->str_buf_.back().data();
    mnt_ctx.source = mnt_ctx.target = const_cast<char*>(i.c_str());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = MS_RDONLY;
    mnt_list_add(ret->mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret->mnt_list_;
  return ret;
}
