/**
 * @file page_store.cpp
 * @brief 페이지 항목 JSON 변환
 */

#include "page_store.h"

#include <QString>

namespace pagecanvas::store {

QJsonObject PageRecord::toJson() const
{
    QJsonObject obj;
    obj["CanvasContent1"] = QString::fromStdString(canvas_content);
    obj["CommentsDisabled"] = comments_disabled;
    obj["Title"] = QString::fromStdString(title);
    obj["PageLayoutType"] = QString::fromStdString(layout_type);
    obj["PromotedState"] = promoted_state;
    obj["BannerImageUrl"] = QString::fromStdString(banner_image_url);
    obj["ClientSideApplicationId"] = QString::fromStdString(client_side_application_id);
    obj["ContentTypeId"] = QString::fromStdString(content_type_id);
    return obj;
}

PageRecord PageRecord::fromJson(const QJsonObject& obj)
{
    PageRecord record;
    record.canvas_content = obj["CanvasContent1"].toString().toStdString();
    record.comments_disabled = obj["CommentsDisabled"].toBool(false);
    record.title = obj["Title"].toString().toStdString();
    record.layout_type = obj["PageLayoutType"].toString("Article").toStdString();
    record.promoted_state = obj["PromotedState"].toInt(0);
    record.banner_image_url =
        obj["BannerImageUrl"].toString(kDefaultBannerImageUrl).toStdString();
    record.client_side_application_id =
        obj["ClientSideApplicationId"].toString(kClientSideApplicationId).toStdString();
    record.content_type_id = obj["ContentTypeId"].toString(kPageContentTypeId).toStdString();
    return record;
}

} // namespace pagecanvas::store
