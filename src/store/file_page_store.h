#pragma once

/**
 * @file file_page_store.h
 * @brief 디렉터리 기반 페이지 저장소
 *
 * 페이지마다 `<root>/<pageRef>.json` 파일 하나를 둡니다.
 */

#include "store/page_store.h"

#include <QJsonObject>
#include <QString>

#include <optional>
#include <string>

namespace pagecanvas::store {

class FilePageStore : public PageStore {
public:
    explicit FilePageStore(const QString& rootPath, bool verbose = false);
    ~FilePageStore() override = default;

    FetchResult fetchPageContent(const std::string& page_ref) override;
    UpdateResult writePageContent(const std::string& page_ref, const std::string& markup) override;
    UpdateResult setCommentsDisabled(const std::string& page_ref, bool disabled) override;
    UpdateResult createPage(const std::string& page_ref, const PageRecord& record) override;
    bool pageExists(const std::string& page_ref) override;

    QString rootPath() const { return m_rootPath; }
    QString pagePath(const std::string& page_ref) const;

private:
    static bool isValidRef(const std::string& page_ref);

    std::optional<QJsonObject> readRecord(const std::string& page_ref, std::string& error) const;
    bool writeRecord(const std::string& page_ref, const QJsonObject& obj, std::string& error);

    // 기존 항목의 단일 필드 갱신
    UpdateResult updateField(const std::string& page_ref, const QString& key, const QJsonValue& value);

    QString m_rootPath;
    bool m_verbose;
};

} // namespace pagecanvas::store
