#include <iostream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <boost/lexical_cast.hpp>
#include "isolation.hpp"

using std::string;
using std::vector;
using std::unique_ptr;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;
using boost::posix_time::microsec_clock;
using boost::posix_time::milliseconds;

namespace Isolation {
    bool silence = false;

    static ptime now() {
        return microsec_clock::universal_time();
    }

    static const char* state_names[] = { "running", "finished", "crashed", "killed", "cancelled" };

    std::ostream& operator<<(std::ostream& os, State s) {
        return os << state_names[static_cast<int>(s)];
    }

    Limits::Limits() : memory_mb(2048), cpu(-1), grace(milliseconds(200)) {}

    Job_result::Job_result() : state(State::cancelled), elapsed_microseconds(0) {}

    //////////////////
    // Process_unit

    static void write_all(int fd, const char* data, size_t len) {
        while (len > 0) {
            ssize_t n = write(fd, data, len);
            if (n < 0) {
                if (errno == EINTR) continue;
                _exit(3);
            }
            data += n;
            len -= n;
        }
    }

    void Process_unit::run_child(const Task& task, int write_fd, const Limits& limits) {
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        setpgid(0, 0);

        if (limits.memory_mb > 0) {
            struct rlimit rl;
            rl.rlim_cur = rl.rlim_max = (rlim_t)limits.memory_mb * 1024 * 1024;
            if (setrlimit(RLIMIT_AS, &rl) != 0) {
                std::cerr << "warning: could not cap unit memory: " << strerror(errno) << std::endl;
            }
        }
        if (limits.cpu >= 0) {
            cpu_set_t set;
            CPU_ZERO(&set);
            CPU_SET(limits.cpu, &set);
            if (sched_setaffinity(0, sizeof(set), &set) != 0) {
                std::cerr << "warning: could not pin unit to cpu " << limits.cpu << ": " << strerror(errno) << std::endl;
            }
        }

        int code = 0;
        try {
            task([write_fd] (const string& line) {
                    string l = line + "\n";
                    write_all(write_fd, l.data(), l.size());
                });
        } catch (const std::exception& e) {
            std::cerr << "unit failed: " << e.what() << std::endl;
            code = 1;
        } catch (...) {
            std::cerr << "unit failed: non-standard exception" << std::endl;
            code = 1;
        }
        close(write_fd);
        std::cout.flush();
        std::cerr.flush();
        _exit(code);
    }

    Process_unit::Process_unit(const Task& task, ptime deadline, const Limits& limits) :
        pid(-1), fd(-1), state_(State::running), deadline_(deadline), grace(limits.grace) {
        int fds[2];
        if (pipe(fds) != 0) {
            throw std::runtime_error(string("Process_unit: pipe failed: ") + strerror(errno));
        }

        // anything still buffered would otherwise be written twice
        std::cout.flush();
        std::cerr.flush();

        pid = fork();
        if (pid < 0) {
            int err = errno;
            close(fds[0]);
            close(fds[1]);
            throw std::runtime_error(string("Process_unit: fork failed: ") + strerror(err));
        }
        if (pid == 0) {
            close(fds[0]);
            run_child(task, fds[1], limits);
        }

        close(fds[1]);
        fd = fds[0];
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
    }

    Process_unit::~Process_unit() {
        if (state_ == State::running) terminate();
        if (fd >= 0) close(fd);
    }

    void Process_unit::drain() {
        if (fd < 0) return;
        char buf[4096];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                partial.append(buf, n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            // EAGAIN, or 0 for end of file
            break;
        }
        size_t start = 0;
        size_t nl;
        while ((nl = partial.find('\n', start)) != string::npos) {
            lines.push_back(partial.substr(start, nl - start));
            start = nl + 1;
        }
        partial.erase(0, start);
    }

    void Process_unit::reaped(int status) {
        drain();
        if (!partial.empty()) {
            lines.push_back(partial);
            partial.clear();
        }
        close(fd);
        fd = -1;
        pid = -1;
        if (WIFEXITED(status)) {
            int code = WEXITSTATUS(status);
            state_ = code == 0 ? State::finished : State::crashed;
            exit_description = "exited with status " + boost::lexical_cast<string>(code);
        } else if (WIFSIGNALED(status)) {
            state_ = State::crashed;
            exit_description = "killed by signal " + boost::lexical_cast<string>(WTERMSIG(status));
        } else {
            state_ = State::crashed;
            exit_description = "stopped";
        }
    }

    State Process_unit::pump() {
        if (state_ != State::running) return state_;
        drain();
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            reaped(status);
        } else if (r < 0 && errno != EINTR) {
            throw std::runtime_error(string("Process_unit: waitpid failed: ") + strerror(errno));
        } else if (now() > deadline_ + grace) {
            terminate();
        }
        return state_;
    }

    State Process_unit::await(ptime until) {
        while (pump() == State::running) {
            ptime t = now();
            if (t >= until) break;
            time_duration wait = std::min(until - t, time_duration(milliseconds(50)));
            struct pollfd p = { fd, POLLIN, 0 };
            poll(&p, 1, std::max<int64_t>(1, wait.total_milliseconds()));
        }
        return state_;
    }

    void Process_unit::terminate(bool cancel) {
        if (state_ != State::running) return;
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        reaped(status);
        state_ = cancel ? State::cancelled : State::killed;
        exit_description = cancel ? "cancelled" : "killed at the deadline";
    }

    //////////////////
    // Stop_flag

    volatile std::sig_atomic_t Stop_flag::flag = 0;

    void Stop_flag::handler(int) {
        flag = 1;
    }

    void Stop_flag::install() {
        struct sigaction sa;
        memset(&sa, 0, sizeof(sa));
        sa.sa_handler = handler;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
    }

    bool Stop_flag::requested() { return flag != 0; }
    void Stop_flag::request() { flag = 1; }
    void Stop_flag::reset() { flag = 0; }

    //////////////////
    // Pool

    vector<int> Pool::allowed_cpus() {
        vector<int> rv;
        cpu_set_t set;
        CPU_ZERO(&set);
        if (sched_getaffinity(0, sizeof(set), &set) == 0) {
            for (int i = 0; i < CPU_SETSIZE; i++) {
                if (CPU_ISSET(i, &set)) rv.push_back(i);
            }
        }
        return rv;
    }

    Pool::Pool(int width_, const Limits& limits) : width(std::max(1, width_)) {
        vector<int> cpus = allowed_cpus();
        // slots share cores only when there are more slots than cores
        factory = [limits, cpus] (const Task& task, ptime deadline, int slot) {
            Limits l = limits;
            if (!cpus.empty()) l.cpu = cpus[slot % cpus.size()];
            return unique_ptr<Unit_intf>(new Process_unit(task, deadline, l));
        };
    }

    Pool::Pool(int width_, Unit_factory factory_) : width(std::max(1, width_)), factory(factory_) {}

    struct Active {
        size_t job;
        int slot;
        ptime started;
        unique_ptr<Unit_intf> unit;
    };

    static void record(Job_result& r, const Active& a, State s) {
        r.state = s;
        r.messages = a.unit->messages();
        r.exit_description = a.unit->describe_exit();
        r.elapsed_microseconds = (now() - a.started).total_microseconds();
    }

    vector<Job_result> Pool::run(const vector<Job>& jobs) {
        vector<Job_result> results(jobs.size());
        vector<Active> active;
        vector<bool> slot_busy(width, false);
        size_t next = 0;

        while (next < jobs.size() || !active.empty()) {
            if (Stop_flag::requested()) {
                for (Active& a : active) {
                    a.unit->terminate(true);
                    record(results[a.job], a, State::cancelled);
                }
                if (!silence) {
                    std::cerr << "stop requested, cancelled " << active.size() << " running and "
                              << (jobs.size() - next) << " pending units" << std::endl;
                }
                // everything not yet started keeps its default cancelled result
                return results;
            }

            while ((int)active.size() < width && next < jobs.size()) {
                int slot = std::find(slot_busy.begin(), slot_busy.end(), false) - slot_busy.begin();
                slot_busy[slot] = true;
                ptime t = now();
                Active a;
                a.job = next;
                a.slot = slot;
                a.started = t;
                a.unit = factory(jobs[next].task, t + jobs[next].budget, slot);
                active.push_back(std::move(a));
                next++;
            }

            // sleep until some unit has output, exits, or reaches its deadline
            vector<struct pollfd> fds;
            ptime wake = now() + milliseconds(100);
            for (const Active& a : active) {
                int h = a.unit->wait_handle();
                if (h >= 0) fds.push_back(pollfd{ h, POLLIN, 0 });
                wake = std::min(wake, a.unit->deadline());
            }
            // past a deadline the unit is in its grace period, no point spinning
            int64_t wait_ms = std::max<int64_t>(5, (wake - now()).total_milliseconds());
            if (fds.empty()) {
                usleep(wait_ms * 1000);
            } else {
                poll(fds.data(), fds.size(), wait_ms);
            }

            for (size_t i = 0; i < active.size(); ) {
                State s = active[i].unit->pump();
                if (s == State::running) {
                    i++;
                    continue;
                }
                record(results[active[i].job], active[i], s);
                slot_busy[active[i].slot] = false;
                active.erase(active.begin() + i);
            }
        }
        return results;
    }

    //////////////////
    // tests

    static string join(const vector<string>& v) {
        string rv;
        for (size_t i = 0; i < v.size(); i++) {
            if (i) rv += " ";
            rv += v[i];
        }
        return rv;
    }

    void test() {
        bool old_silence = silence;
        silence = true;
        Limits limits;
        limits.memory_mb = 256;

        std::stringstream output;
        std::stringstream expected;

        {
            Process_unit u([] (const Send& send) { send("hello"); send("world"); },
                           now() + milliseconds(2000), limits);
            State s = u.await(now() + milliseconds(5000));
            output << s << " " << join(u.messages()) << std::endl;
            expected << "finished hello world" << std::endl;
        }

        {
            ptime start = now();
            Process_unit u([] (const Send& send) {
                    send("started");
                    volatile uint64_t spin = 0;
                    while (true) spin++;
                }, now() + milliseconds(100), limits);
            State s = u.await(now() + milliseconds(5000));
            output << s << " " << join(u.messages()) << " " << ((now() - start).total_milliseconds() < 2000) << std::endl;
            expected << "killed started 1" << std::endl;
        }

        {
            Process_unit u([] (const Send& send) { send("before"); raise(SIGSEGV); },
                           now() + milliseconds(2000), limits);
            State s = u.await(now() + milliseconds(5000));
            output << s << " " << join(u.messages()) << " " << u.describe_exit() << std::endl;
            expected << "crashed before killed by signal " << SIGSEGV << std::endl;
        }

        {
            Process_unit u([] (const Send& send) { throw std::runtime_error("nope"); },
                           now() + milliseconds(2000), limits);
            State s = u.await(now() + milliseconds(5000));
            output << s << " " << u.describe_exit() << std::endl;
            expected << "crashed exited with status 1" << std::endl;
        }

        {
            Process_unit u([] (const Send& send) {
                    try {
                        vector<char> big((size_t)1024 * 1024 * 1024, 1);
                        send("allocated");
                    } catch (const std::bad_alloc&) {
                        send("bad_alloc");
                    }
                }, now() + milliseconds(5000), limits);
            State s = u.await(now() + milliseconds(10000));
            output << s << " " << join(u.messages()) << std::endl;
            expected << "finished bad_alloc" << std::endl;
        }

        {
            Process_unit u([] (const Send& send) { send("x"); while (true) usleep(1000); },
                           now() + milliseconds(60000), limits);
            u.await(now() + milliseconds(200));
            u.terminate(true);
            output << u.state() << " " << join(u.messages()) << std::endl;
            expected << "cancelled x" << std::endl;
        }

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            silence = old_silence;
            throw std::runtime_error("Isolation::test() 1 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }

        // each job reports when it ran, no more than [width] may overlap
        const int width = 3;
        vector<Job> jobs;
        for (int i = 0; i < 7; i++) {
            Job j;
            j.budget = milliseconds(3000);
            j.task = [i] (const Send& send) {
                int64_t t0 = (now() - ptime(boost::gregorian::date(2020, 1, 1))).total_microseconds();
                usleep(150 * 1000);
                int64_t t1 = (now() - ptime(boost::gregorian::date(2020, 1, 1))).total_microseconds();
                send(boost::lexical_cast<string>(i) + " " + boost::lexical_cast<string>(t0) + " "
                     + boost::lexical_cast<string>(t1));
            };
            jobs.push_back(j);
        }
        Job hang;
        hang.budget = milliseconds(100);
        hang.task = [] (const Send& send) { while (true) usleep(1000); };
        jobs.push_back(hang);

        Pool pool(width, limits);
        vector<Job_result> results = pool.run(jobs);

        vector<std::pair<int64_t, int>> events;
        for (int i = 0; i < 7; i++) {
            if (results[i].state != State::finished || results[i].messages.size() != 1) {
                silence = old_silence;
                throw std::runtime_error("Isolation::test() 2 failed, job " + boost::lexical_cast<string>(i) + " "
                                         + state_names[static_cast<int>(results[i].state)]);
            }
            std::stringstream ss(results[i].messages[0]);
            int id;
            int64_t t0, t1;
            ss >> id >> t0 >> t1;
            if (id != i) {
                silence = old_silence;
                throw std::runtime_error("Isolation::test() 3 failed, results out of order");
            }
            events.push_back(std::make_pair(t0, 1));
            events.push_back(std::make_pair(t1, -1));
        }
        std::sort(events.begin(), events.end());
        int overlap = 0;
        int max_overlap = 0;
        for (const auto& e : events) {
            overlap += e.second;
            max_overlap = std::max(max_overlap, overlap);
        }
        if (max_overlap > width || results[7].state != State::killed) {
            silence = old_silence;
            throw std::runtime_error("Isolation::test() 4 failed, overlap " + boost::lexical_cast<string>(max_overlap)
                                     + ", last job " + state_names[static_cast<int>(results[7].state)]);
        }

        // a stop request launches nothing
        Stop_flag::request();
        results = pool.run(jobs);
        Stop_flag::reset();
        silence = old_silence;
        for (const Job_result& r : results) {
            if (r.state != State::cancelled || !r.messages.empty()) {
                throw std::runtime_error("Isolation::test() 5 failed, job ran after a stop request");
            }
        }
    }
}
