#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
std::atomic<bool> stop{false};
std::mutex        lock;
unsigned          winner = 0;
void run(unsigned id) {
    std::lock_guard<std::mutex> guard(lock);
    if (not stop.exchange(true)) {
        winner = id;
    }
}
int main() {
    std::vector<std::thread> threads;
    for (unsigned i = 1; i != 3; ++i) { threads.emplace_back(run, i); }
    for (auto& t : threads) { t.join(); }
    return winner == 0;
}
