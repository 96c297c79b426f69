#include <chsexpr/chsexpr.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

// A schematic shaped like the ones eeschema writes: one placed symbol per
// entry, each with pins, properties and a handful of nested effects.
chsexpr::node make_schematic(std::size_t n_symbols) {
  using namespace chsexpr;

  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> grid(0, 400);

  node sch("kicad_sch",
           node("version", 20250114),
           node("generator", quoted("eeschema")),
           node("generator_version", quoted("9.0")),
           uuid("6ba7b811-9dad-11d1-80b4-00c04fd430c8"),
           node("paper", quoted("A4")));
  sch.child("lib_symbols");

  for (std::size_t i = 0; i < n_symbols; ++i) {
    const double x = grid(rng) * 1.27;
    const double y = grid(rng) * 1.27;
    const std::string ref = "R" + std::to_string(i + 1);

    node& sym = sch.child("symbol",
                          node("lib_id", quoted("Device:R")),
                          at(x, y, (i % 2 == 0) ? 0 : 90),
                          node("unit", 1),
                          node("exclude_from_sim", atom("no")),
                          node("in_bom", atom("yes")),
                          node("on_board", atom("yes")),
                          node("dnp", atom("no")));
    sym.add(uuid("00000000-0000-0000-0000-" + std::to_string(100000000000ull + i)));
    sym.add(property("Reference", ref, at(x + 2.54, y, 0),
                     node("effects", node("font", node("size", 1.27, 1.27)), node("justify", atom("left")))));
    sym.add(property("Value", "10k", at(x + 2.54, y + 2.54, 0),
                     node("effects", node("font", node("size", 1.27, 1.27)))));
    sym.add(property("Footprint", "Resistor_SMD:R_0603_1608Metric", at(x, y, 0),
                     node("effects", node("font", node("size", 1.27, 1.27)), atom("hide"))));
    sym.child("pin", quoted("1")).add(uuid("pin-1-" + ref));
    sym.child("pin", quoted("2")).add(uuid("pin-2-" + ref));
  }

  sch.child("sheet_instances").child("path", quoted("/"), node("page", quoted("1")));
  sch.add(node("embedded_fonts", atom("no")));
  return sch;
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t bytes = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    bytes = br.bytes;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], bytes};
}

bench_result bench_tokenize(std::string_view text, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto toks = chsexpr::detail::tokenize(text);
    do_not_optimize(toks.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, text.size() * iters};
}

bench_result bench_parse(std::string_view text, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = chsexpr::parse(text);
    do_not_optimize(r.err.code);
    do_not_optimize(r.val.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, text.size() * iters};
}

bench_result bench_dump(const chsexpr::node& root, const chsexpr::serialize_options& opt, std::size_t iters) {
  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    auto out = chsexpr::dump(root, opt);
    bytes += out.size();
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, bytes};
}

void print_mbps(const char* name, const bench_result& r) {
  const double mb = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mbps = (r.seconds > 0.0) ? (mb / r.seconds) : 0.0;
  std::cout << name << ": " << mbps << " MiB/s (" << r.seconds << " s)" << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_symbols = 500;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_symbols = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const chsexpr::node schematic = make_schematic(n_symbols);
  const std::string payload = schematic.to_string();
  std::cout << "payload bytes: " << payload.size() << "\n";

  // Warm-up
  {
    auto r = chsexpr::parse(payload);
    if (r.err) {
      std::cerr << "input parse failed: " << chsexpr::error_message(r.err) << "\n";
      return 1;
    }
    do_not_optimize(r.val.size());
  }

  chsexpr::serialize_options flat;
  flat.pretty = false;

  print_mbps("tokenize", run_median(runs, [&] { return bench_tokenize(payload, iters); }));
  print_mbps("parse", run_median(runs, [&] { return bench_parse(payload, iters); }));
  print_mbps("dump(pretty)", run_median(runs, [&] { return bench_dump(schematic, chsexpr::serialize_options{}, iters); }));
  print_mbps("dump(flat)", run_median(runs, [&] { return bench_dump(schematic, flat, iters); }));

  return 0;
}
