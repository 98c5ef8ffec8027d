#include "SessionManager.hpp"
#include "TimeUtil.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <random>
#include <utility>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr int kListenBacklog = 16;
constexpr std::size_t kRecvChunk = 4096;
constexpr std::size_t kMaxLineBytes = 1 << 20;

// Random (version 4) UUID rendering used as the client id.
std::string newClientId(){
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<unsigned> byte(0, 255);
    unsigned char b[16];
    for(auto& v : b) v = static_cast<unsigned char>(byte(gen));
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);
    char out[37];
    std::snprintf(out, sizeof(out),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return out;
}

std::string socketError(const char* what){
    return std::string(what) + ": " + std::strerror(errno);
}

}  // namespace

SessionManager::SessionManager(std::shared_ptr<const EnsembleClassifier> classifier,
                               std::shared_ptr<ClassificationLog> log,
                               SessionManagerConfig config)
: classifier(std::move(classifier)), log(std::move(log)), config(std::move(config)) {}

SessionManager::~SessionManager(){ stop(); }

void SessionManager::addObserver(SessionObserver* observer){
    if(observer) observers.push_back(observer);
}

// ----------------------------------------------------------------------
// Session lifecycle
// ----------------------------------------------------------------------

bool SessionManager::registerClient(std::string& clientId){
    ClientSession session;
    {
        std::lock_guard<std::mutex> lock(sessionsMu);
        if(live.size() >= config.maxClients) return false;
        do { session.clientId = newClientId(); } while(live.count(session.clientId));
        session.connectTimeMs = wallClockMs();
        session.lastActivityMs = session.connectTimeMs;
        live.emplace(session.clientId, session);
    }
    clientId = session.clientId;
    if(log && !log->append(connectionRecord(RecordKind::Connect, clientId, session.connectTimeMs))){
        for(auto* o : observers) o->onLogAppendFailed(clientId);
    }
    for(auto* o : observers) o->onConnected(session);
    return true;
}

void SessionManager::unregisterClient(const std::string& clientId){
    ClientSession session;
    {
        std::lock_guard<std::mutex> lock(sessionsMu);
        const auto it = live.find(clientId);
        if(it == live.end()) return;
        session = it->second;
        live.erase(it);
    }
    const std::int64_t now = wallClockMs();
    if(log && !log->append(connectionRecord(RecordKind::Disconnect, clientId, now))){
        for(auto* o : observers) o->onLogAppendFailed(clientId);
    }
    const double durationSeconds = static_cast<double>(now - session.connectTimeMs) / 1000.0;
    for(auto* o : observers) o->onDisconnected(session, durationSeconds);
}

std::string SessionManager::handleMessage(const std::string& clientId, const std::string& text){
    const auto started = std::chrono::steady_clock::now();

    SensorFrame frame;
    FrameError err;
    std::vector<std::string> warnings;
    if(!decodeFrame(text, frame, err, warnings)){
        for(auto* o : observers) o->onFrameRejected(clientId, err);
        return encodeError(err);
    }
    for(const auto& w : warnings) warn(clientId, w);

    ClassificationResult result;
    try {
        result = classifier->classify(frame);
    } catch(const std::exception& e){
        err.id = frame.messageId;
        err.error = "Classification failed";
        err.details = e.what();
        for(auto* o : observers) o->onFrameRejected(clientId, err);
        return encodeError(err);
    }
    for(const auto& d : result.diagnostics) warn(clientId, d);

    const std::int64_t now = wallClockMs();
    if(log && !log->append(predictionRecord(clientId, frame.deviceId, now, result))){
        for(auto* o : observers) o->onLogAppendFailed(clientId);
    }
    {
        std::lock_guard<std::mutex> lock(sessionsMu);
        const auto it = live.find(clientId);
        if(it != live.end()){
            it->second.lastActivityMs = now;
            ++it->second.predictionsCount;
        }
    }
    tracker.record(std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());
    for(auto* o : observers) o->onFrameProcessed(clientId, frame, result);
    return encodeResponse(frame, result);
}

void SessionManager::warn(const std::string& clientId, const std::string& message){
    for(auto* o : observers) o->onWarning(clientId, message);
}

ThroughputSnapshot SessionManager::snapshot() const{
    return tracker.snapshot(activeClients());
}

std::size_t SessionManager::activeClients() const{
    std::lock_guard<std::mutex> lock(sessionsMu);
    return live.size();
}

std::vector<ClientSession> SessionManager::sessions() const{
    std::lock_guard<std::mutex> lock(sessionsMu);
    std::vector<ClientSession> out;
    out.reserve(live.size());
    for(const auto& kv : live) out.push_back(kv.second);
    return out;
}

// ----------------------------------------------------------------------
// Socket transport
// ----------------------------------------------------------------------

bool SessionManager::start(std::string& error){
    if(isRunning.load()){
        error = "session manager already running";
        return false;
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;
    struct addrinfo* res = nullptr;
    const std::string service = std::to_string(config.port);
    const char* host = config.host.empty() ? nullptr : config.host.c_str();
    const int gai = ::getaddrinfo(host, service.c_str(), &hints, &res);
    if(gai != 0){
        error = "cannot resolve " + config.host + ": " + ::gai_strerror(gai);
        return false;
    }

    const int fd = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if(fd < 0){
        error = socketError("socket");
        ::freeaddrinfo(res);
        return false;
    }
    const int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    if(::bind(fd, res->ai_addr, res->ai_addrlen) != 0){
        error = socketError("bind");
        ::freeaddrinfo(res);
        ::close(fd);
        return false;
    }
    ::freeaddrinfo(res);
    if(::listen(fd, kListenBacklog) != 0){
        error = socketError("listen");
        ::close(fd);
        return false;
    }

    struct sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if(::getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &len) != 0){
        error = socketError("getsockname");
        ::close(fd);
        return false;
    }
    port = ntohs(bound.sin_port);
    listenFd = fd;

    isRunning.store(true);
    acceptThread = std::thread(&SessionManager::acceptLoop, this);
    reporterThread = std::thread(&SessionManager::reportLoop, this);
    return true;
}

void SessionManager::stop(){
    if(!isRunning.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(reportMu);
    }
    reportCv.notify_all();

    // Wakes the blocked accept().
    ::shutdown(listenFd, SHUT_RDWR);
    if(acceptThread.joinable()) acceptThread.join();
    ::close(listenFd);
    listenFd = -1;

    std::vector<std::shared_ptr<Connection>> remaining;
    {
        std::lock_guard<std::mutex> lock(connectionsMu);
        for(const auto& c : connections){
            if(c->fd >= 0) ::shutdown(c->fd, SHUT_RDWR);
        }
        remaining.swap(connections);
    }
    for(const auto& c : remaining){
        if(c->worker.joinable()) c->worker.join();
    }
    if(reporterThread.joinable()) reporterThread.join();
}

void SessionManager::acceptLoop(){
    while(isRunning.load()){
        const int fd = ::accept(listenFd, nullptr, nullptr);
        if(fd < 0){
            if(errno == EINTR) continue;
            if(!isRunning.load()) break;
            warn("", socketError("accept"));
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        reapFinished();
        auto conn = std::make_shared<Connection>();
        conn->fd = fd;
        std::lock_guard<std::mutex> lock(connectionsMu);
        connections.push_back(conn);
        conn->worker = std::thread(&SessionManager::serve, this, conn);
    }
}

void SessionManager::reapFinished(){
    std::lock_guard<std::mutex> lock(connectionsMu);
    for(auto it = connections.begin(); it != connections.end();){
        if((*it)->state.load() == ConnectionState::Closed){
            if((*it)->worker.joinable()) (*it)->worker.join();
            it = connections.erase(it);
        } else {
            ++it;
        }
    }
}

void SessionManager::serve(const std::shared_ptr<Connection>& conn){
    std::string clientId;
    if(!registerClient(clientId)){
        FrameError err;
        err.error = "Server full";
        err.details = "maximum of " + std::to_string(config.maxClients) + " clients connected";
        sendLine(conn->fd, encodeError(err));
        closeConnection(*conn);
        conn->state.store(ConnectionState::Closed);
        return;
    }
    conn->state.store(ConnectionState::Active);

    std::string carry;
    std::vector<char> buffer(kRecvChunk, 0);
    bool open = true;
    while(open){
        const ssize_t count = ::recv(conn->fd, buffer.data(), buffer.size(), 0);
        if(count < 0 && errno == EINTR) continue;
        if(count <= 0){
            // The peer finished sending; a last frame may lack its newline.
            if(count == 0 && !carry.empty()){
                if(carry.back() == '\r') carry.pop_back();
                if(!carry.empty()) sendLine(conn->fd, handleMessage(clientId, carry));
            }
            break;
        }
        carry.append(buffer.data(), static_cast<std::size_t>(count));
        std::size_t searchStart = 0;
        for(;;){
            const auto newline = carry.find('\n', searchStart);
            if(newline == std::string::npos){
                carry.erase(0, searchStart);
                break;
            }
            std::string record = carry.substr(searchStart, newline - searchStart);
            searchStart = newline + 1;
            if(!record.empty() && record.back() == '\r') record.pop_back();
            if(record.empty()) continue;
            if(!sendLine(conn->fd, handleMessage(clientId, record))){
                open = false;
                break;
            }
        }
        if(open && carry.size() > kMaxLineBytes){
            FrameError err;
            err.error = "Frame too large";
            err.details = "no newline within " + std::to_string(kMaxLineBytes) + " bytes";
            carry.clear();
            open = sendLine(conn->fd, encodeError(err));
        }
    }

    unregisterClient(clientId);
    closeConnection(*conn);
    conn->state.store(ConnectionState::Closed);
}

bool SessionManager::sendLine(int fd, const std::string& payload){
    const std::string line = payload + "\n";
    std::size_t sent = 0;
    while(sent < line.size()){
        const ssize_t n = ::send(fd, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
        if(n < 0 && errno == EINTR) continue;
        if(n <= 0) return false;
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

void SessionManager::closeConnection(Connection& conn){
    std::lock_guard<std::mutex> lock(connectionsMu);
    if(conn.fd >= 0){
        ::close(conn.fd);
        conn.fd = -1;
    }
}

void SessionManager::reportLoop(){
    std::unique_lock<std::mutex> lock(reportMu);
    while(!reportCv.wait_for(lock, config.reportInterval, [this]{ return !isRunning.load(); })){
        lock.unlock();
        const ThroughputSnapshot s = snapshot();
        for(auto* o : observers) o->onThroughput(s);
        lock.lock();
    }
}
