/* Isolated execution units.

   A unit runs a Task somewhere it can't hurt the caller: a crash, an infinite loop or a
   runaway allocation inside the task only ever takes down the unit. The task reports
   back one line at a time through [send]; the owner collects those lines, and kills the
   unit if it's still running at its deadline (plus a short grace period for process
   start-up). Nothing here knows about games, the orchestrator only uses Unit_intf and Pool.

   Process_unit is the real implementation: fork(), a pipe back to the parent, its own
   process group, an address-space cap (RLIMIT_AS) and a single pinned core.
*/

#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <csignal>
#include <sys/types.h>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace Isolation {
    typedef std::function<void(const std::string& line)> Send;
    typedef std::function<void(const Send& send)> Task;

    enum class State
        { running,
          finished,   // the task returned normally
          crashed,    // non-zero exit status or a signal
          killed,     // still running at the deadline
          cancelled }; // stopped (or never started) because a stop was requested

    std::ostream& operator<<(std::ostream& os, State s);

    struct Limits {
        Limits();
        int memory_mb; // 0 = no cap
        int cpu;       // core to pin to, -1 = don't pin
        boost::posix_time::time_duration grace;
    };

    class Unit_intf {
    public:
        virtual ~Unit_intf() {};

        // Collects anything the unit has sent, notices if it has exited, and kills it if it
        // is past its deadline. Never blocks.
        virtual State pump() = 0;

        // pump()s until the unit is no longer running or [until] passes
        virtual State await(boost::posix_time::ptime until) = 0;

        // force the unit to stop now, it ends up killed (or cancelled if [cancel])
        virtual void terminate(bool cancel = false) = 0;

        virtual State state() const = 0;
        virtual const std::vector<std::string>& messages() const = 0;
        virtual std::string describe_exit() const = 0;
        virtual boost::posix_time::ptime deadline() const = 0;

        // a descriptor that becomes readable when pump() has something to do, or -1
        virtual int wait_handle() const = 0;
    };

    class Process_unit : public Unit_intf {
    public:
        // forks immediately, throws std::runtime_error if it can't
        Process_unit(const Task& task, boost::posix_time::ptime deadline, const Limits& limits);
        virtual ~Process_unit();

        virtual State pump();
        virtual State await(boost::posix_time::ptime until);
        virtual void terminate(bool cancel = false);
        virtual State state() const { return state_; }
        virtual const std::vector<std::string>& messages() const { return lines; }
        virtual std::string describe_exit() const { return exit_description; }
        virtual boost::posix_time::ptime deadline() const { return deadline_; }
        virtual int wait_handle() const { return fd; }
    private:
        Process_unit(const Process_unit&);
        Process_unit& operator=(const Process_unit&);

        static void run_child(const Task& task, int write_fd, const Limits& limits);
        void drain();
        void reaped(int status);

        pid_t pid;
        int fd;
        State state_;
        boost::posix_time::ptime deadline_;
        boost::posix_time::time_duration grace;
        std::string partial;
        std::vector<std::string> lines;
        std::string exit_description;
    };

    /* Tournament-wide stop request. install() hooks SIGINT and SIGTERM; everything that
       launches units checks requested() and stops launching. */
    class Stop_flag {
    public:
        static void install();
        static bool requested();
        static void request();
        static void reset();
    private:
        static volatile std::sig_atomic_t flag;
        static void handler(int);
    };

    struct Job {
        Task task;
        boost::posix_time::time_duration budget;
    };

    struct Job_result {
        Job_result();
        State state;
        std::vector<std::string> messages;
        std::string exit_description;
        int64_t elapsed_microseconds;
    };

    typedef std::function<std::unique_ptr<Unit_intf>(const Task& task, boost::posix_time::ptime deadline, int slot)>
        Unit_factory;

    // Runs jobs with at most [width] units alive at once. Results come back in job order,
    // whatever order the units actually finish in.
    class Pool {
    public:
        // Process_units with [limits], slot i pinned to the i-th allowed core (mod the count)
        Pool(int width, const Limits& limits);
        Pool(int width, Unit_factory factory);

        std::vector<Job_result> run(const std::vector<Job>& jobs);

        // cores this process may run on
        static std::vector<int> allowed_cpus();
    private:
        int width;
        Unit_factory factory;
    };

    // mutes the pool's progress lines
    extern bool silence;

    void test();
}
