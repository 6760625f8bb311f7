#include "file_page_store.h"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

#include <iostream>

namespace pagecanvas::store {

FilePageStore::FilePageStore(const QString& rootPath, bool verbose)
    : m_rootPath(rootPath)
    , m_verbose(verbose)
{
    QDir().mkpath(rootPath);
}

QString FilePageStore::pagePath(const std::string& page_ref) const
{
    return m_rootPath + "/" + QString::fromStdString(page_ref) + ".json";
}

bool FilePageStore::isValidRef(const std::string& page_ref)
{
    if (page_ref.empty() || page_ref == "." || page_ref == "..") return false;
    return page_ref.find('/') == std::string::npos && page_ref.find('\\') == std::string::npos;
}

// ============================================================
// 파일 입출력
// ============================================================

std::optional<QJsonObject> FilePageStore::readRecord(const std::string& page_ref,
                                                     std::string& error) const
{
    if (!isValidRef(page_ref)) {
        error = "잘못된 페이지 이름: '" + page_ref + "'";
        return std::nullopt;
    }

    QFile file(pagePath(page_ref));
    if (!file.open(QIODevice::ReadOnly)) {
        error = "페이지를 찾을 수 없음: '" + page_ref + "'";
        return std::nullopt;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        error = "페이지 파일 파싱 실패: " + parseError.errorString().toStdString();
        return std::nullopt;
    }

    return doc.object();
}

bool FilePageStore::writeRecord(const std::string& page_ref, const QJsonObject& obj,
                                std::string& error)
{
    QFile file(pagePath(page_ref));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        error = "페이지 파일 쓰기 실패: " + file.errorString().toStdString();
        return false;
    }

    QJsonDocument doc(obj);
    file.write(doc.toJson(QJsonDocument::Compact));
    return true;
}

// ============================================================
// PageStore 구현
// ============================================================

FetchResult FilePageStore::fetchPageContent(const std::string& page_ref)
{
    FetchResult result;

    auto obj = readRecord(page_ref, result.error_message);
    if (!obj) {
        std::cerr << "[FilePageStore] " << result.error_message << std::endl;
        return result;
    }

    result.record = PageRecord::fromJson(*obj);
    result.success = true;

    if (m_verbose) {
        std::cout << "[FilePageStore] 페이지 로드: " << page_ref
                  << " (" << result.record.canvas_content.size() << " bytes)" << std::endl;
    }
    return result;
}

UpdateResult FilePageStore::updateField(const std::string& page_ref, const QString& key,
                                        const QJsonValue& value)
{
    UpdateResult result;

    auto obj = readRecord(page_ref, result.error_message);
    if (!obj) {
        std::cerr << "[FilePageStore] " << result.error_message << std::endl;
        return result;
    }

    (*obj)[key] = value;
    if (!writeRecord(page_ref, *obj, result.error_message)) {
        std::cerr << "[FilePageStore] " << result.error_message << std::endl;
        return result;
    }

    if (m_verbose) {
        std::cout << "[FilePageStore] " << key.toStdString() << " 갱신: " << page_ref << std::endl;
    }
    result.success = true;
    return result;
}

UpdateResult FilePageStore::writePageContent(const std::string& page_ref, const std::string& markup)
{
    return updateField(page_ref, "CanvasContent1", QString::fromStdString(markup));
}

UpdateResult FilePageStore::setCommentsDisabled(const std::string& page_ref, bool disabled)
{
    return updateField(page_ref, "CommentsDisabled", disabled);
}

UpdateResult FilePageStore::createPage(const std::string& page_ref, const PageRecord& record)
{
    UpdateResult result;

    if (!isValidRef(page_ref)) {
        result.error_message = "잘못된 페이지 이름: '" + page_ref + "'";
        std::cerr << "[FilePageStore] " << result.error_message << std::endl;
        return result;
    }

    if (pageExists(page_ref)) {
        result.error_message = "A file with the name '" + page_ref + "' already exists";
        std::cerr << "[FilePageStore] " << result.error_message << std::endl;
        return result;
    }

    if (!writeRecord(page_ref, record.toJson(), result.error_message)) {
        std::cerr << "[FilePageStore] " << result.error_message << std::endl;
        return result;
    }

    if (m_verbose) {
        std::cout << "[FilePageStore] 페이지 생성: " << page_ref << std::endl;
    }
    result.success = true;
    return result;
}

bool FilePageStore::pageExists(const std::string& page_ref)
{
    return isValidRef(page_ref) && QFile::exists(pagePath(page_ref));
}

} // namespace pagecanvas::store
