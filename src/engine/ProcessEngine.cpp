#include "ProcessEngine.hpp"

#include "../job/EventDecoder.hpp"
#include "../processing/JsonSanitizer.hpp"
#include "../translate/OpenAIBatchTranslator.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace engine
{

namespace
{

std::once_flag g_sigpipe_once;

void closeFd(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

std::string describeExit(int status)
{
    if (WIFEXITED(status))
        return "engine exited with status " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status))
        return "engine killed by signal " + std::to_string(WTERMSIG(status));
    return "engine ended abnormally";
}

bool isCleanExit(int status)
{
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

std::string stringMember(const nlohmann::json& obj, const char* key, const std::string& fallback)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return fallback;
    return it->get<std::string>();
}

} // namespace

// Shared by the engine and its streams; serializes calls into the translator.
struct TranslationBridge
{
    std::shared_ptr<translate::OpenAIBatchTranslator> translator;
    std::mutex mtx;

    nlohmann::json answer(const nlohmann::json& request, const std::string& default_src,
                          const std::string& default_dst)
    {
        nlohmann::json response = {
            { "type", "translate_response" },
            { "request_id", request.contains("request_id") ? request["request_id"] : nlohmann::json() },
            { "ok", false },
            { "used_fallback", false },
            { "items", nlohmann::json::array() },
            { "missing_ids", nlohmann::json::array() },
            { "error", "" },
        };

        auto it = request.find("fragments");
        if (it == request.end() || !it->is_array())
        {
            response["error"] = "translate_request without a fragments array";
            PLOG_WARNING << "Engine sent a translate_request without fragments";
            return response;
        }

        std::vector<translate::SourceFragment> fragments;
        fragments.reserve(it->size());
        for (const auto& node : *it)
        {
            if (!node.is_object() || !node.contains("id") || !node["id"].is_number_integer() ||
                !node.contains("text") || !node["text"].is_string())
            {
                PLOG_WARNING << "Skipping malformed fragment in translate_request: " << node.dump();
                continue;
            }
            fragments.push_back({ node["id"].get<int>(), node["text"].get<std::string>() });
        }

        const std::string src = stringMember(request, "lang_in", default_src);
        const std::string dst = stringMember(request, "lang_out", default_dst);

        translate::BatchResult result;
        {
            std::lock_guard<std::mutex> lock(mtx);
            result = translator->translateBatch(fragments, src, dst);
        }

        for (const auto& item : result.items)
            response["items"].push_back({ { "id", item.id }, { "output", item.output } });
        response["missing_ids"] = result.missing_ids;
        response["ok"] = result.ok;
        response["used_fallback"] = result.used_fallback;
        response["error"] = result.error;
        return response;
    }
};

namespace
{

class ProcessEventStream final : public IEventStream
{
public:
    ProcessEventStream(pid_t pid, int out_fd, int in_fd, bool clean_lines, std::shared_ptr<TranslationBridge> bridge,
                       const job::RunConfig& config, std::chrono::milliseconds grace)
        : pid_(pid)
        , out_fd_(out_fd)
        , in_fd_(in_fd)
        , clean_lines_(clean_lines)
        , bridge_(std::move(bridge))
        , source_lang_(config.source_lang)
        , target_lang_(config.target_lang)
        , grace_(grace)
    {
    }

    ~ProcessEventStream() override { close(); }

    StreamStatus next(job::JobEvent& out, std::chrono::milliseconds wait) override
    {
        if (closed_)
            return StreamStatus::Closed;

        if (lines_.empty() && !eof_)
            readAvailable(wait);

        if (!lines_.empty())
        {
            std::string line = std::move(lines_.front());
            lines_.pop_front();
            if (clean_lines_)
                line = processing::clean_json_output(line);

            // Model calls are not events; the controller just sees a quiet tick.
            if (answerTranslateRequest(line))
                return StreamStatus::Idle;

            decode(line, out);
            return StreamStatus::Event;
        }

        if (!eof_)
            return StreamStatus::Idle;

        return reap(wait);
    }

    void close() noexcept override
    {
        if (closed_)
            return;
        closed_ = true;
        closeFd(out_fd_);
        closeFd(in_fd_);

        if (reaped_)
            return;

        if (waitFor(grace_))
        {
            if (!isCleanExit(exit_status_))
                PLOG_WARNING << "Engine process " << pid_ << " ended after the run: " << describeExit(exit_status_);
            return;
        }

        PLOG_INFO << "Engine process " << pid_ << " still running, sending SIGTERM";
        signalGroup(SIGTERM);
        if (waitFor(std::chrono::milliseconds(500)))
            return;

        PLOG_WARNING << "Engine process " << pid_ << " ignored SIGTERM, sending SIGKILL";
        signalGroup(SIGKILL);
        while (::waitpid(pid_, &exit_status_, 0) < 0 && errno == EINTR)
        {
        }
        reaped_ = true;
    }

private:
    void readAvailable(std::chrono::milliseconds wait)
    {
        pollfd pfd{};
        pfd.fd = out_fd_;
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, static_cast<int>(wait.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                return;
            throw TransportError(std::string("poll() failed: ") + std::strerror(errno));
        }
        if (ready == 0)
            return;

        char chunk[4096];
        const ssize_t n = ::read(out_fd_, chunk, sizeof(chunk));
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                return;
            throw TransportError(std::string("read() failed: ") + std::strerror(errno));
        }

        if (n == 0)
        {
            eof_ = true;
            if (!buf_.empty())
            {
                lines_.push_back(std::move(buf_));
                buf_.clear();
            }
            return;
        }

        buf_.append(chunk, static_cast<std::size_t>(n));
        std::size_t pos = 0;
        while (true)
        {
            const std::size_t nl = buf_.find('\n', pos);
            if (nl == std::string::npos)
                break;
            lines_.push_back(buf_.substr(pos, nl - pos));
            pos = nl + 1;
        }
        buf_.erase(0, pos);
    }

    void decode(const std::string& line, job::JobEvent& out) const
    {
        std::string error;
        if (!job::decodeEventLine(line, out, error))
            throw TransportError(error);
    }

    bool answerTranslateRequest(const std::string& line)
    {
        if (!bridge_ || line.find("\"translate_request\"") == std::string::npos)
            return false;

        nlohmann::json request;
        try
        {
            request = nlohmann::json::parse(line);
        }
        catch (const nlohmann::json::parse_error&)
        {
            return false;
        }
        if (!request.is_object() || stringMember(request, "type", {}) != "translate_request")
            return false;

        const nlohmann::json response = bridge_->answer(request, source_lang_, target_lang_);
        writeLine(response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        return true;
    }

    void writeLine(const std::string& payload)
    {
        if (in_fd_ < 0)
            throw TransportError("engine input is already closed");

        const std::string line = payload + "\n";
        std::size_t written = 0;
        while (written < line.size())
        {
            const ssize_t n = ::write(in_fd_, line.data() + written, line.size() - written);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw TransportError(std::string("cannot send translation reply to engine: ") + std::strerror(errno));
            }
            written += static_cast<std::size_t>(n);
        }
    }

    // The child leads its own process group; fall back to the pid alone if
    // setpgid lost the race with exec.
    void signalGroup(int sig)
    {
        if (::kill(-pid_, sig) == 0)
            return;
        if (::kill(pid_, sig) != 0 && errno != ESRCH)
            PLOG_WARNING << "kill(" << pid_ << ", " << sig << ") failed: " << std::strerror(errno);
    }

    StreamStatus reap(std::chrono::milliseconds wait)
    {
        if (!reaped_ && !waitFor(wait))
            return StreamStatus::Idle;

        closed_ = true;
        closeFd(out_fd_);
        closeFd(in_fd_);
        if (isCleanExit(exit_status_))
            return StreamStatus::Closed;
        throw TransportError(describeExit(exit_status_));
    }

    bool waitFor(std::chrono::milliseconds limit)
    {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (true)
        {
            const pid_t w = ::waitpid(pid_, &exit_status_, WNOHANG);
            if (w == pid_ || (w < 0 && errno == ECHILD))
            {
                reaped_ = true;
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    pid_t pid_;
    int out_fd_;
    int in_fd_;
    bool clean_lines_;
    std::shared_ptr<TranslationBridge> bridge_;
    std::string source_lang_;
    std::string target_lang_;
    std::chrono::milliseconds grace_;

    std::string buf_;
    std::deque<std::string> lines_;
    bool eof_ = false;
    bool closed_ = false;
    bool reaped_ = false;
    int exit_status_ = 0;
};

} // namespace

ProcessEngine::ProcessEngine(ProcessEngineConfig config)
    : cfg_(std::move(config))
{
    if (cfg_.translator)
    {
        bridge_ = std::make_shared<TranslationBridge>();
        bridge_->translator = cfg_.translator;
    }
}

ProcessEngine::~ProcessEngine() = default;

bool ProcessEngine::setOutputSanitizer(std::shared_ptr<const processing::IJsonSanitizer> sanitizer)
{
    if (!bridge_)
        return false;

    std::lock_guard<std::mutex> lock(bridge_->mtx);
    bridge_->translator->setOutputSanitizer(std::move(sanitizer));
    return true;
}

std::unique_ptr<IEventStream> ProcessEngine::startStream(const job::RunConfig& config)
{
    if (cfg_.command.empty())
        throw TransportError("engine command is empty");

    std::call_once(g_sigpipe_once, []() { std::signal(SIGPIPE, SIG_IGN); });

    std::vector<std::string> args;
    args.push_back(cfg_.command);
    args.insert(args.end(), cfg_.args.begin(), cfg_.args.end());

    std::vector<char*> cargs;
    cargs.reserve(args.size() + 1);
    for (std::string& s : args)
        cargs.push_back(s.data());
    cargs.push_back(nullptr);

    const std::string settings = config.toJson().dump() + "\n";

    int in_pipe[2] = { -1, -1 };
    int out_pipe[2] = { -1, -1 };
    int exec_pipe[2] = { -1, -1 };
    auto closeAll = [&]()
    {
        for (int* fds : { &in_pipe[0], &out_pipe[0], &exec_pipe[0] })
        {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
    };
    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0)
    {
        const std::string reason = std::strerror(errno);
        closeAll();
        throw TransportError("pipe() failed: " + reason);
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        const std::string reason = std::strerror(errno);
        closeAll();
        throw TransportError("fork() failed: " + reason);
    }

    if (pid == 0)
    {
        ::setpgid(0, 0);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::execvp(cargs[0], cargs.data());
        const int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Both sides call setpgid; EACCES means the child already exec'd after its own call.
    if (::setpgid(pid, pid) != 0 && errno != EACCES)
        PLOG_DEBUG << "setpgid(" << pid << ") failed: " << std::strerror(errno);

    closeFd(in_pipe[0]);
    closeFd(out_pipe[1]);
    closeFd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t got = 0;
    do
    {
        got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    closeFd(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        closeFd(in_pipe[1]);
        closeFd(out_pipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        throw TransportError("cannot start engine '" + cfg_.command + "': " + std::strerror(exec_errno));
    }

    PLOG_DEBUG << "Started engine process " << pid << ": " << cfg_.command
               << (bridge_ ? " (answering translate requests)" : "");

    std::size_t written = 0;
    while (written < settings.size())
    {
        const ssize_t n = ::write(in_pipe[1], settings.data() + written, settings.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            PLOG_WARNING << "Engine process did not accept its settings: " << std::strerror(errno);
            break;
        }
        written += static_cast<std::size_t>(n);
    }

    // Without a bridge nothing else is ever sent; EOF tells the child so.
    int keep_in = -1;
    if (bridge_)
        std::swap(keep_in, in_pipe[1]);
    else
        closeFd(in_pipe[1]);

    return std::make_unique<ProcessEventStream>(pid, out_pipe[0], keep_in, cfg_.clean_event_lines, bridge_, config,
                                                cfg_.shutdown_grace);
}

} // namespace engine
