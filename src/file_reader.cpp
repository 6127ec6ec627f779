#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <thread>
#include <future>
#include <algorithm>
#include <utility>
#include "posix_fd.hpp"

static void scan_newlines(const char* data, size_t s, size_t e, std::vector<size_t>& out) {
  for (size_t i = s; i < e; ++i) {
    if (data[i] == '\n') out.push_back(i);
  }
}

/*newline positions of the whole map; big files are scanned in parallel chunks*/
static std::vector<size_t> find_newlines(const char* data, size_t n) {
  const size_t min_parallel_size = 1 << 20;
  unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0) hw = 4;
  std::vector<size_t> nl;
  if (n < min_parallel_size || hw == 1) {
    scan_newlines(data, 0, n, nl);
    return nl;
  }
  unsigned threads = std::max(2u, std::min<unsigned>(hw, static_cast<unsigned>(n / min_parallel_size)));
  std::vector<std::vector<size_t>> parts(threads);
  std::vector<std::future<void>> futs;
  size_t chunk = n / threads;
  for (unsigned t = 0; t < threads; ++t) {
    size_t s = t * chunk;
    size_t e = (t + 1 == threads) ? n : (t + 1) * chunk;
    futs.emplace_back(std::async(std::launch::async, [&, s, e, t]{ scan_newlines(data, s, e, parts[t]); }));
  }
  for (auto& f : futs) f.get();
  size_t total = 0;
  for (const auto& p : parts) total += p.size();
  nl.reserve(total);
  for (const auto& p : parts) nl.insert(nl.end(), p.begin(), p.end());
  return nl;
}

static void push_line(const char* data, size_t start, size_t end, std::vector<std::string>& out) {
  if (end > start && data[end - 1] == '\r') end--;
  out.emplace_back(data + start, end - start);
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (S_ISDIR(st.st_mode)) { msg = std::string("is a directory: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = std::string("opened file: ") + path.string(); return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);

  std::vector<size_t> nl = find_newlines(data, n);
  out_lines.reserve(nl.size() + 1);
  size_t start = 0;
  for (size_t pos : nl) {
    push_line(data, start, pos, out_lines);
    start = pos + 1;
  }
  if (start < n) push_line(data, start, n, out_lines);

  ::munmap(mem, n);
  msg = std::string("opened file: ") + path.string();
  return true;
}
