#include "LinuxSocketTableReader.h"

#include "ProcNetDecoder.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <string>
#include <cerrno>
#include <system_error>
#include <utility>

namespace Platform
{

LinuxSocketTableReader::LinuxSocketTableReader(std::shared_ptr<IProcessCorrelator> correlator, std::filesystem::path procRoot)
    : m_Correlator(std::move(correlator)), m_ProcRoot(std::move(procRoot))
{
}

std::expected<std::vector<Connection>, ProcReadError> LinuxSocketTableReader::readTable(SocketProtocol protocol)
{
    const auto path = m_ProcRoot / "net" / std::string(toString(protocol));

    errno = 0;
    std::ifstream file(path);
    if (!file.is_open())
    {
        const std::error_code code(errno != 0 ? errno : ENOENT, std::generic_category());
        return std::unexpected(ProcReadError{.path = path, .code = code});
    }

    const std::string contents{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad())
    {
        return std::unexpected(ProcReadError{.path = path, .code = std::make_error_code(std::errc::io_error)});
    }

    return parseTable(protocol, contents);
}

std::vector<Connection> LinuxSocketTableReader::readConnections()
{
    std::vector<Connection> connections;

    for (const auto protocol : ALL_SOCKET_PROTOCOLS)
    {
        auto table = readTable(protocol);
        if (!table)
        {
            // IPv6 tables are absent when the kernel is built without it.
            spdlog::debug("Skipping {} table: {}", toString(protocol), table.error().message());
            continue;
        }

        connections.insert(connections.end(), std::make_move_iterator(table->begin()), std::make_move_iterator(table->end()));
    }

    return connections;
}

std::vector<Connection> LinuxSocketTableReader::parseTable(SocketProtocol protocol, std::string_view contents)
{
    std::vector<Connection> connections;

    std::size_t lineStart = 0;
    bool headerSkipped = false;

    while (lineStart < contents.size())
    {
        auto lineEnd = contents.find('\n', lineStart);
        if (lineEnd == std::string_view::npos)
        {
            lineEnd = contents.size();
        }
        const auto line = contents.substr(lineStart, lineEnd - lineStart);
        lineStart = lineEnd + 1;

        if (!headerSkipped)
        {
            headerSkipped = true;
            continue;
        }
        if (line.find_first_not_of(" \t\r") == std::string_view::npos)
        {
            continue;
        }

        auto parsed = ProcNet::parseSocketLine(line);
        if (!parsed)
        {
            spdlog::trace("Dropping malformed {} line: {}", toString(protocol), parsed.error().message);
            continue;
        }

        Connection connection;
        connection.protocol = std::string(toString(protocol));
        connection.state = std::move(parsed->state);
        connection.local = std::move(parsed->local);
        connection.remote = std::move(parsed->remote);

        if (parsed->inode != 0 && m_Correlator)
        {
            connection.setIdentity(m_Correlator->processInfo(parsed->inode));
        }

        connections.push_back(std::move(connection));
    }

    return connections;
}

} // namespace Platform
